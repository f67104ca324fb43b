#include "pwnreport/common/util.h"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <thread>

#include <spdlog/fmt/fmt.h>


namespace {

    namespace chr = std::chrono;
    using SteadyClock = chr::steady_clock;


    void sleep_cold_until(const SteadyClock::time_point& until) {
        std::this_thread::sleep_until(until);
    }

    bool is_unreserved(const char c) {
        if ('a' <= c && c <= 'z')
            return true;
        if ('A' <= c && c <= 'Z')
            return true;
        if ('0' <= c && c <= '9')
            return true;

        switch (c) {
            case '-':
            case '.':
            case '_':
            case '~':
                return true;
            default:
                return false;
        }
    }

}  // namespace


// Header functions
namespace pwn {

    bool is_readable_file(const fs::path& path) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec))
            return false;

        std::ifstream file(path, std::ios::binary);
        return file.is_open();
    }

    std::optional<std::string> read_text_file(const fs::path& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
            return std::nullopt;

        std::string content;
        content.assign(
            std::istreambuf_iterator<char>(file),
            std::istreambuf_iterator<char>()
        );
        return content;
    }

    std::string url_encode(std::string_view str) {
        std::string output;
        output.reserve(str.size());

        for (const char c : str) {
            if (::is_unreserved(c))
                output += c;
            else
                output += fmt::format("%{:02X}", static_cast<uint8_t>(c));
        }

        return output;
    }

    std::string to_lower_ascii(std::string_view str) {
        std::string output{ str };
        for (auto& c : output) {
            if ('A' <= c && c <= 'Z')
                c = static_cast<char>(c - 'A' + 'a');
        }
        return output;
    }

}  // namespace pwn


// ThreadSleeper
namespace pwn {

    void ThreadSleeper::sleep_for(double seconds) {
        if (!(seconds > 0.0))
            return;
        if (seconds > MAX_WAIT_SEC)
            seconds = MAX_WAIT_SEC;

        const auto delta = chr::duration_cast<SteadyClock::duration>(
            chr::duration<double>{ seconds }
        );
        ::sleep_cold_until(SteadyClock::now() + delta);
    }

}  // namespace pwn
