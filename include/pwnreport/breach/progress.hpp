#pragma once

#include <cstdio>

#include "pwnreport/breach/collector.hpp"


namespace pwn {

    // Redraws a single console line for every finished request. With
    // `one_line_per_request` each request ends its own line, so debug logs
    // printed between requests don't land in the middle of a redraw.
    class ProgressLine {

    public:
        ProgressLine(std::FILE* out, bool one_line_per_request);

        void update(const CollectProgress& p);

        // Ends the current line if one is open
        void finish();

    private:
        std::FILE* out_;
        bool one_line_per_request_;
        bool open_ = false;
    };

}  // namespace pwn
