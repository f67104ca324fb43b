#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "pwnreport/breach/formatter.hpp"


namespace {

    using strvec_t = std::vector<std::string>;


    TEST(Formatter, FindsNamesInTruncatedResponse) {
        const auto names = pwn::find_breach_names(
            R"([{"Name":"Adobe"},{"Name":"LinkedIn"},{"Name":"Dropbox"}])"
        );

        const strvec_t expected{ "Adobe", "LinkedIn", "Dropbox" };
        ASSERT_EQ(names, expected);
    }

    TEST(Formatter, KeyIsCaseInsensitive) {
        const auto names = pwn::find_breach_names(
            R"([{"name":"lower"},{"NAME":"Upper"}])"
        );

        const strvec_t expected{ "lower", "Upper" };
        ASSERT_EQ(names, expected);
    }

    TEST(Formatter, MalformedBodiesYieldNothing) {
        ASSERT_TRUE(pwn::find_breach_names("").empty());
        ASSERT_TRUE(pwn::find_breach_names("<html>Too many requests</html>").empty());
        ASSERT_TRUE(pwn::find_breach_names(R"({"Name": "spaced"})").empty());
        ASSERT_TRUE(pwn::find_breach_names(R"([{"Name":"cut)").empty());
    }

    TEST(Formatter, CutBodyKeepsLeadingNames) {
        const auto names = pwn::find_breach_names(
            R"([{"Name":"Adobe"},{"Name":"Linke)"
        );

        const strvec_t expected{ "Adobe" };
        ASSERT_EQ(names, expected);
    }

    TEST(Formatter, NameWithInvalidUtf8Byte) {
        const auto names = pwn::find_breach_names(
            "[{\"Name\":\"Caf\xe9\"},{\"Name\":\"Adobe\"}]"
        );

        const strvec_t expected{ "Caf\xe9", "Adobe" };
        ASSERT_EQ(names, expected);
    }

    TEST(Formatter, InvalidUtf8NameStillIndexed) {
        pwn::RawResults raw;
        raw.set("a@x.com", "[{\"Name\":\"Caf\xe9\"}]");

        const auto index = pwn::index_by_breach(raw);

        const auto entry = index.find("Caf\xe9");
        ASSERT_NE(entry, nullptr);
        ASSERT_EQ(entry->emails_, strvec_t{ "a@x.com" });
    }

    TEST(Formatter, SingleBreachSingleAccount) {
        pwn::RawResults raw;
        raw.set("a@x.com", R"([{"Name":"BreachA"}])");

        const auto index = pwn::index_by_breach(raw);

        ASSERT_EQ(index.size(), 1);
        const auto entry = index.find("BreachA");
        ASSERT_NE(entry, nullptr);
        ASSERT_EQ(entry->emails_, strvec_t{ "a@x.com" });
    }

    TEST(Formatter, AccountInSeveralBreaches) {
        pwn::RawResults raw;
        raw.set("a@x.com", R"([{"Name":"Adobe"},{"Name":"LinkedIn"}])");
        raw.set("b@x.com", R"([{"Name":"LinkedIn"}])");
        raw.set("c@x.com", R"([{"Name":"Canva"},{"Name":"Adobe"}])");

        const auto index = pwn::index_by_breach(raw);

        ASSERT_EQ(index.size(), 3);
        ASSERT_EQ(
            index.find("Adobe")->emails_, (strvec_t{ "a@x.com", "c@x.com" })
        );
        ASSERT_EQ(
            index.find("LinkedIn")->emails_, (strvec_t{ "a@x.com", "b@x.com" })
        );
        ASSERT_EQ(index.find("Canva")->emails_, strvec_t{ "c@x.com" });
    }

    TEST(Formatter, BreachOrderIsFirstSeen) {
        pwn::RawResults raw;
        raw.set("z@x.com", R"([{"Name":"Zeta"},{"Name":"Alpha"}])");
        raw.set("y@x.com", R"([{"Name":"Mid"},{"Name":"Zeta"}])");

        const auto index = pwn::index_by_breach(raw);

        strvec_t order;
        for (const auto& entry : index)
            order.push_back(entry.name_);
        ASSERT_EQ(order, (strvec_t{ "Zeta", "Alpha", "Mid" }));
    }

    TEST(Formatter, BodiesWithoutNamesContributeNothing) {
        pwn::RawResults raw;
        raw.set("a@x.com", "Service unavailable");

        const auto index = pwn::index_by_breach(raw);
        ASSERT_TRUE(index.empty());
    }

}  // namespace


int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
