#pragma once

#include <stdexcept>
#include <string>


namespace pwn {

    // Input file missing or unreadable
    class InputError : public std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // No email address found in the input
    class ExtractionError : public std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Too many unexpected HTTP statuses, the API is likely throttling us
    class RateLimitError : public std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    class ConfigError : public std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    class ReportError : public std::runtime_error {
        using std::runtime_error::runtime_error;
    };

}  // namespace pwn
