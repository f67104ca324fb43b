#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "pwnreport/breach/collector.hpp"
#include "pwnreport/http/client.hpp"


namespace pwn {

    namespace fs = std::filesystem;


    struct AppConfig {
        std::string api_url_ = "https://haveibeenpwned.com/api/v3/breachedaccount";
        std::string user_agent_ = "pwned_reportv1";
        std::string api_key_header_ = "hibp-api-key";
        std::string api_key_;

        double sleep_sec_ = 1.6;
        double timeout_sec_ = 30.0;
        double connect_timeout_sec_ = 10.0;
        int fail_threshold_ = 3;

        fs::path in_path_;
        fs::path out_path_ = "pwned.txt";
        bool dedupe_ = false;
    };


    // Values given on the command line. Unset optionals keep whatever the
    // defaults or the config file chose.
    struct CliOverrides {
        std::string api_key_;
        fs::path in_path_;
        std::optional<double> sleep_sec_;
        std::optional<double> timeout_sec_;
        std::optional<fs::path> out_path_;
        bool dedupe_ = false;
    };


    // Keys present in the YAML mapping override the values in `base`.
    // Throws ConfigError on malformed YAML or a value of the wrong type.
    AppConfig parse_config_yaml(const std::string& content, AppConfig base);
    AppConfig load_config_file(const fs::path& path, AppConfig base);

    AppConfig apply_cli_overrides(AppConfig base, const CliOverrides& cli);

    // Throws ConfigError
    void validate_config(const AppConfig& config);

    CollectorConfig make_collector_config(const AppConfig& config);
    HttpClientOptions make_http_options(const AppConfig& config);

}  // namespace pwn
