#include "pwnreport/breach/collector.hpp"

#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "pwnreport/common/errors.h"


namespace {

    bool is_expected_status(const long status) {
        return 200 == status || 404 == status;
    }

}  // namespace


// RawResults
namespace pwn {

    void RawResults::set(const std::string& email, std::string body) {
        const auto found = index_.find(email);
        if (index_.end() != found) {
            entries_[found->second].body_ = std::move(body);
            return;
        }

        index_.emplace(email, entries_.size());
        entries_.push_back(Entry{ email, std::move(body) });
    }

    const std::string* RawResults::find(const std::string& email) const {
        const auto found = index_.find(email);
        if (index_.end() == found)
            return nullptr;
        return &entries_[found->second].body_;
    }

}  // namespace pwn


// BreachCollector
namespace pwn {

    BreachCollector::BreachCollector(
        const CollectorConfig& config, IHttpClient& http, ISleeper& sleeper
    )
        : config_(config), http_(http), sleeper_(sleeper) {}

    void BreachCollector::set_progress_callback(progress_func_t func) {
        progress_ = std::move(func);
    }

    RawResults BreachCollector::collect(const EmailList& emails) {
        RawResults results;
        failures_ = 0;

        const auto headers = this->make_headers();

        for (size_t i = 0; i < emails.size(); ++i) {
            const auto& address = emails[i];
            const auto url = this->make_url(address);
            spdlog::debug("GET {}", url);

            const auto res = http_.get(url, headers);

            if (progress_)
                progress_(CollectProgress{ i + 1, emails.size(), res.status_ });

            if (!::is_expected_status(res.status_)) {
                ++failures_;
                if (res.error_.empty())
                    spdlog::debug(
                        "Unexpected HTTP status {} for '{}' ({}/{})",
                        res.status_,
                        address,
                        failures_,
                        config_.fail_threshold_
                    );
                else
                    spdlog::debug(
                        "Request for '{}' failed: {} ({}/{})",
                        address,
                        res.error_,
                        failures_,
                        config_.fail_threshold_
                    );

                if (failures_ >= config_.fail_threshold_) {
                    throw RateLimitError{ fmt::format(
                        "Possible rate limiting encountered ({} unexpected "
                        "responses, last HTTP status {})",
                        failures_,
                        res.status_
                    ) };
                }
            }

            if (!res.body_.empty()) {
                spdlog::debug(
                    "'{}' has breach data ({} bytes)", address, res.body_.size()
                );
                results.set(address, res.body_);
            }

            sleeper_.sleep_for(config_.sleep_sec_);
        }

        return results;
    }

    std::string BreachCollector::make_url(const std::string& email) const {
        return fmt::format(
            "{}/{}?truncateResponse=true", config_.api_url_, url_encode(email)
        );
    }

    HttpHeaders BreachCollector::make_headers() const {
        return HttpHeaders{
            { "User-Agent", config_.user_agent_ },
            { config_.api_key_header_, config_.api_key_ },
        };
    }

}  // namespace pwn
