#pragma once

#include <filesystem>
#include <string>

#include "pwnreport/breach/formatter.hpp"


namespace pwn {

    namespace fs = std::filesystem;

    // Markdown blocks ready to paste into a report:
    //
    //   **BreachName**
    //   * a@example.com
    //   <blank line>
    std::string build_report_str(const BreachIndex& index);

    // Overwrites `path`. Throws ReportError if it can't be written.
    void write_report(const BreachIndex& index, const fs::path& path);

}  // namespace pwn
