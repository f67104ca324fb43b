#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>


namespace pwn {

    namespace fs = std::filesystem;

    // Longest sleep or timeout accepted anywhere, one day
    constexpr double MAX_WAIT_SEC = 86400.0;

    bool is_readable_file(const fs::path& path);
    std::optional<std::string> read_text_file(const fs::path& path);

    // Percent-encodes everything but RFC 3986 unreserved characters
    std::string url_encode(std::string_view str);
    std::string to_lower_ascii(std::string_view str);


    class ISleeper {

    public:
        virtual ~ISleeper() = default;

        virtual void sleep_for(double seconds) = 0;
    };


    class ThreadSleeper : public ISleeper {

    public:
        void sleep_for(double seconds) override;
    };

}  // namespace pwn
