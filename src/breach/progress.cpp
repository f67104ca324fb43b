#include "pwnreport/breach/progress.hpp"

#include <spdlog/fmt/fmt.h>


namespace pwn {

    ProgressLine::ProgressLine(std::FILE* out, bool one_line_per_request)
        : out_(out), one_line_per_request_(one_line_per_request) {}

    void ProgressLine::update(const CollectProgress& p) {
        fmt::print(
            out_,
            "\r[+] Checking {} out of {}    |    HTTP Status: {}",
            p.current_,
            p.total_,
            p.status_
        );
        std::fflush(out_);
        open_ = true;

        if (one_line_per_request_ || p.current_ == p.total_)
            this->finish();
    }

    void ProgressLine::finish() {
        if (!open_)
            return;
        fmt::print(out_, "\n");
        std::fflush(out_);
        open_ = false;
    }

}  // namespace pwn
