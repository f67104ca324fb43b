#pragma once

#include <cstddef>

#include "pwnreport/breach/collector.hpp"
#include "pwnreport/common/config.h"
#include "pwnreport/common/util.h"
#include "pwnreport/http/client.hpp"


namespace pwn {

    struct RunSummary {
        size_t emails_found_ = 0;
        size_t emails_queried_ = 0;
        size_t accounts_breached_ = 0;
        size_t breach_count_ = 0;
    };


    // Throws InputError unless `path` is a regular file we can open
    void check_input_file(const fs::path& path);


    // Extract, collect, format, write. Each stage finishes before the next
    // one starts and the report is only written if every request went
    // through without tripping the failure threshold.
    //
    // Throws InputError, ExtractionError, RateLimitError or ReportError.
    RunSummary run_pipeline(
        const AppConfig& config,
        IHttpClient& http,
        ISleeper& sleeper,
        progress_func_t progress = nullptr
    );

}  // namespace pwn
