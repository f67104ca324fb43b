#include "pwnreport/common/config.h"

#include <cmath>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

#include "pwnreport/common/errors.h"
#include "pwnreport/common/util.h"


namespace {

    YAML::Node load_yaml(const std::string& content) {
        try {
            return YAML::Load(content);
        } catch (const YAML::Exception& e) {
            throw pwn::ConfigError{ fmt::format(
                "Malformed config: {}", e.what()
            ) };
        }
    }

    void check_seconds(const char* label, double v, bool allow_zero) {
        if (!std::isfinite(v))
            throw pwn::ConfigError{ fmt::format(
                "{} must be a finite number: {}", label, v
            ) };
        if (allow_zero ? (v < 0.0) : (v <= 0.0))
            throw pwn::ConfigError{ fmt::format(
                "{} must be {}: {}",
                label,
                allow_zero ? "zero or more" : "positive",
                v
            ) };
        if (v > pwn::MAX_WAIT_SEC)
            throw pwn::ConfigError{ fmt::format(
                "{} must not exceed {} seconds: {}", label, pwn::MAX_WAIT_SEC, v
            ) };
    }

    template <typename T>
    void read_key(const YAML::Node& root, const char* key, T& out) {
        const auto node = root[key];
        if (!node.IsDefined() || node.IsNull())
            return;

        try {
            out = node.as<T>();
        } catch (const YAML::Exception&) {
            throw pwn::ConfigError{ fmt::format(
                "Invalid value for config key '{}' (line {})",
                key,
                node.Mark().line + 1
            ) };
        }
    }

}  // namespace


namespace pwn {

    AppConfig parse_config_yaml(const std::string& content, AppConfig base) {
        const YAML::Node root = ::load_yaml(content);
        if (root.IsNull())
            return base;
        if (!root.IsMap())
            throw ConfigError{ "Config root must be a mapping" };

        ::read_key(root, "api_url", base.api_url_);
        ::read_key(root, "user_agent", base.user_agent_);
        ::read_key(root, "api_key_header", base.api_key_header_);
        ::read_key(root, "sleep", base.sleep_sec_);
        ::read_key(root, "timeout", base.timeout_sec_);
        ::read_key(root, "connect_timeout", base.connect_timeout_sec_);
        ::read_key(root, "fail_threshold", base.fail_threshold_);

        std::string outfile;
        ::read_key(root, "outfile", outfile);
        if (!outfile.empty())
            base.out_path_ = fs::u8path(outfile);

        return base;
    }

    AppConfig load_config_file(const fs::path& path, AppConfig base) {
        const auto content = read_text_file(path);
        if (!content.has_value()) {
            throw ConfigError{ fmt::format(
                "Cannot read config file: '{}'", path.u8string()
            ) };
        }

        return parse_config_yaml(*content, std::move(base));
    }

    AppConfig apply_cli_overrides(AppConfig base, const CliOverrides& cli) {
        base.api_key_ = cli.api_key_;
        base.in_path_ = cli.in_path_;

        if (cli.sleep_sec_)
            base.sleep_sec_ = *cli.sleep_sec_;
        if (cli.timeout_sec_)
            base.timeout_sec_ = *cli.timeout_sec_;
        if (cli.out_path_)
            base.out_path_ = *cli.out_path_;

        base.dedupe_ = cli.dedupe_;
        return base;
    }

    void validate_config(const AppConfig& config) {
        if (config.api_key_.empty())
            throw ConfigError{ "API key must not be empty" };
        if (config.api_url_.empty())
            throw ConfigError{ "API URL must not be empty" };
        if (config.api_key_header_.empty())
            throw ConfigError{ "API key header name must not be empty" };
        ::check_seconds("Sleep", config.sleep_sec_, true);
        ::check_seconds("Timeout", config.timeout_sec_, false);
        ::check_seconds(
            "Connect timeout", config.connect_timeout_sec_, false
        );
        if (config.fail_threshold_ < 1)
            throw ConfigError{ fmt::format(
                "Failure threshold must be at least 1: {}",
                config.fail_threshold_
            ) };
    }

    CollectorConfig make_collector_config(const AppConfig& config) {
        CollectorConfig output;
        output.api_url_ = config.api_url_;
        output.user_agent_ = config.user_agent_;
        output.api_key_header_ = config.api_key_header_;
        output.api_key_ = config.api_key_;
        output.sleep_sec_ = config.sleep_sec_;
        output.fail_threshold_ = config.fail_threshold_;
        return output;
    }

    HttpClientOptions make_http_options(const AppConfig& config) {
        HttpClientOptions output;
        output.timeout_sec_ = config.timeout_sec_;
        output.connect_timeout_sec_ = config.connect_timeout_sec_;
        return output;
    }

}  // namespace pwn
