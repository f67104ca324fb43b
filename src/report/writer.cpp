#include "pwnreport/report/writer.hpp"

#include <fstream>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "pwnreport/common/errors.h"


namespace pwn {

    std::string build_report_str(const BreachIndex& index) {
        std::string output;

        for (const auto& breach : index) {
            output += fmt::format("**{}**\n", breach.name_);
            for (const auto& email : breach.emails_)
                output += fmt::format("* {}\n", email);
            output += '\n';
        }

        return output;
    }

    void write_report(const BreachIndex& index, const fs::path& path) {
        spdlog::info("Writing results to {}", path.u8string());

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw ReportError{ fmt::format(
                "Cannot open output file: '{}'", path.u8string()
            ) };
        }

        const auto content = build_report_str(index);
        file.write(content.data(), content.size());
        file.close();
        if (file.fail()) {
            throw ReportError{ fmt::format(
                "Failed to write output file: '{}'", path.u8string()
            ) };
        }
    }

}  // namespace pwn
