#include "work_functions.hpp"

#include <cstdio>
#include <filesystem>
#include <string>
#include <utility>

#include <argparse/argparse.hpp>
#include <spdlog/spdlog.h>

#include "pwnreport/breach/progress.hpp"
#include "pwnreport/common/config.h"
#include "pwnreport/common/errors.h"
#include "pwnreport/http/client.hpp"
#include "pwnreport/pipeline.hpp"


namespace fs = std::filesystem;


namespace {

    pwn::AppConfig build_config(const argparse::ArgumentParser& parser) {
        pwn::AppConfig config;

        if (const auto path = parser.present<std::string>("--config")) {
            config = pwn::load_config_file(fs::u8path(*path), config);
            spdlog::debug("Loaded config from {}", *path);
        }

        pwn::CliOverrides cli;
        cli.api_key_ = parser.get<std::string>("--apikey");
        cli.in_path_ = fs::u8path(parser.get<std::string>("--infile"));
        cli.sleep_sec_ = parser.present<double>("--sleep");
        cli.timeout_sec_ = parser.present<double>("--timeout");
        if (const auto v = parser.present<std::string>("--outfile"))
            cli.out_path_ = fs::u8path(*v);
        cli.dedupe_ = parser.get<bool>("--dedupe");

        config = pwn::apply_cli_overrides(std::move(config), cli);
        pwn::validate_config(config);
        return config;
    }

}  // namespace


namespace pwn {

    void work_report(int argc, char* argv[]) {
        argparse::ArgumentParser parser{
            "pwnreport", "1.0", argparse::default_arguments::help
        };
        parser.add_description(
            "Check haveibeenpwned for compromised email addresses."
        );
        parser.add_argument("-a", "--apikey").help("HIBP API key").required();
        parser.add_argument("-f", "--infile")
            .help("Text file with email addresses, formatted any way you like")
            .required();
        parser.add_argument("-s", "--sleep")
            .help("Seconds to sleep between each email. Default is 1.6")
            .scan<'g', double>();
        parser.add_argument("-o", "--outfile")
            .help("Report file to write output to. Default is pwned.txt");
        parser.add_argument("-t", "--timeout")
            .help("Seconds before a single request gives up. Default is 30")
            .scan<'g', double>();
        parser.add_argument("-c", "--config").help("YAML config file");
        parser.add_argument("-d", "--dedupe")
            .help("Query each address only once")
            .default_value(false)
            .implicit_value(true);
        parser.add_argument("-v", "--verbose")
            .help("Log every request")
            .default_value(false)
            .implicit_value(true);
        parser.parse_args(argc, argv);

        const auto verbose = parser.get<bool>("--verbose");
        if (verbose)
            spdlog::set_level(spdlog::level::debug);

        const auto config = ::build_config(parser);
        pwn::check_input_file(config.in_path_);

        const auto http = pwn::create_http_client_curl(
            pwn::make_http_options(config)
        );
        pwn::ThreadSleeper sleeper;
        pwn::ProgressLine progress{ stdout, verbose };

        try {
            pwn::run_pipeline(
                config, *http, sleeper, [&progress](const auto& p) {
                    progress.update(p);
                }
            );
        } catch (const pwn::RateLimitError&) {
            progress.finish();
            throw;
        }

        spdlog::info("All done, enjoy!");
    }

}  // namespace pwn
