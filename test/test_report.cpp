#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "pwnreport/common/errors.h"
#include "pwnreport/report/writer.hpp"


namespace {

    namespace fs = std::filesystem;


    fs::path make_temp_path(const std::string& name) {
        return fs::temp_directory_path() / fs::u8path(name);
    }

    std::vector<std::string> read_lines(const fs::path& path) {
        std::ifstream file(path);
        std::vector<std::string> output;
        std::string line;
        while (std::getline(file, line))
            output.push_back(line);
        return output;
    }

    pwn::BreachIndex make_index() {
        pwn::RawResults raw;
        raw.set("a@x.com", R"([{"Name":"Adobe"},{"Name":"LinkedIn"}])");
        raw.set("b@x.com", "");
        raw.set("c@x.com", R"([{"Name":"LinkedIn"}])");
        return pwn::index_by_breach(raw);
    }


    TEST(Report, BlockLayout) {
        const auto text = pwn::build_report_str(::make_index());

        ASSERT_EQ(
            text,
            "**Adobe**\n"
            "* a@x.com\n"
            "\n"
            "**LinkedIn**\n"
            "* a@x.com\n"
            "* c@x.com\n"
            "\n"
        );
    }

    TEST(Report, EmptyIndexWritesEmptyFile) {
        const auto path = ::make_temp_path("pwnreport_test_empty.txt");
        pwn::write_report(pwn::BreachIndex{}, path);

        ASSERT_TRUE(fs::exists(path));
        ASSERT_EQ(fs::file_size(path), 0);
        fs::remove(path);
    }

    TEST(Report, ReReadMatchesDiscoveryOrder) {
        const auto index = ::make_index();
        const auto path = ::make_temp_path("pwnreport_test_reread.txt");
        pwn::write_report(index, path);

        const auto lines = ::read_lines(path);
        size_t pos = 0;
        for (const auto& breach : index) {
            ASSERT_LT(pos, lines.size());
            ASSERT_EQ(lines[pos++], "**" + breach.name_ + "**");
            for (const auto& email : breach.emails_) {
                ASSERT_LT(pos, lines.size());
                ASSERT_EQ(lines[pos++], "* " + email);
            }
            ASSERT_LT(pos, lines.size());
            ASSERT_EQ(lines[pos++], "");
        }
        ASSERT_EQ(pos, lines.size());

        fs::remove(path);
    }

    TEST(Report, OverwritesExistingFile) {
        const auto path = ::make_temp_path("pwnreport_test_overwrite.txt");
        {
            std::ofstream file(path);
            file << "stale content that is much longer than the new report\n"
                 << "and spans more than one line\n";
        }

        pwn::BreachIndex index;
        index.add("Canva", "z@x.com");
        pwn::write_report(index, path);

        std::ifstream file(path);
        std::stringstream ss;
        ss << file.rdbuf();
        ASSERT_EQ(ss.str(), "**Canva**\n* z@x.com\n\n");

        file.close();
        fs::remove(path);
    }

    TEST(Report, UnwritablePathThrows) {
        const auto path = ::make_temp_path("pwnreport_no_such_dir") /
                          "nested" / "out.txt";
        ASSERT_THROW(
            pwn::write_report(::make_index(), path), pwn::ReportError
        );
    }

}  // namespace


int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
