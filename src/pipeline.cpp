#include "pwnreport/pipeline.hpp"

#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "pwnreport/breach/formatter.hpp"
#include "pwnreport/common/errors.h"
#include "pwnreport/extract/email.hpp"
#include "pwnreport/report/writer.hpp"


namespace {

    pwn::EmailList extract_stage(const pwn::fs::path& in_path) {
        pwn::check_input_file(in_path);

        spdlog::info("Processing {}", in_path.u8string());
        const auto text = pwn::read_text_file(in_path);
        if (!text.has_value()) {
            throw pwn::InputError{ fmt::format(
                "Failed to read input file: '{}'", in_path.u8string()
            ) };
        }

        auto emails = pwn::find_emails(*text);
        if (emails.empty())
            throw pwn::ExtractionError{ "No valid emails found" };

        spdlog::info(
            "Found {} valid email addresses in {}",
            emails.size(),
            in_path.u8string()
        );
        return emails;
    }

}  // namespace


namespace pwn {

    void check_input_file(const fs::path& path) {
        if (!is_readable_file(path)) {
            throw InputError{ fmt::format(
                "Cannot access input file: '{}'", path.u8string()
            ) };
        }
    }

    RunSummary run_pipeline(
        const AppConfig& config,
        IHttpClient& http,
        ISleeper& sleeper,
        progress_func_t progress
    ) {
        RunSummary summary;

        auto emails = ::extract_stage(config.in_path_);
        summary.emails_found_ = emails.size();

        if (config.dedupe_) {
            emails = dedupe_emails(emails);
            spdlog::info("{} unique addresses after deduplication", emails.size());
        }
        summary.emails_queried_ = emails.size();

        BreachCollector collector{ make_collector_config(config), http, sleeper };
        collector.set_progress_callback(std::move(progress));
        const auto raw_results = collector.collect(emails);
        summary.accounts_breached_ = raw_results.size();
        spdlog::info("Found {} accounts with breach data", raw_results.size());

        const auto breaches = index_by_breach(raw_results);
        summary.breach_count_ = breaches.size();
        spdlog::info("{} distinct breaches", breaches.size());

        write_report(breaches, config.out_path_);
        return summary;
    }

}  // namespace pwn
