#include "pwnreport/extract/email.hpp"

#include <unordered_set>

#include <re2/re2.h>

#include "pwnreport/common/util.h"


namespace {

    RE2::Options make_pattern_options() {
        RE2::Options options;
        options.set_case_sensitive(false);
        // Input is arbitrary text, so treat it as bytes
        options.set_encoding(RE2::Options::EncodingLatin1);
        options.set_log_errors(false);
        return options;
    }

    const RE2& email_pattern() {
        static const RE2 pattern{
            "([A-Z0-9._%+-]+@[A-Z0-9.-]+\\.[A-Z]{2,})",
            ::make_pattern_options()
        };
        return pattern;
    }

}  // namespace


namespace pwn {

    EmailList find_emails(std::string_view text) {
        EmailList output;

        re2::StringPiece input{ text.data(), text.size() };
        std::string match;
        while (RE2::FindAndConsume(&input, ::email_pattern(), &match)) {
            output.push_back(match);
        }

        return output;
    }

    EmailList dedupe_emails(const EmailList& emails) {
        EmailList output;
        std::unordered_set<std::string> seen;

        for (const auto& x : emails) {
            if (seen.insert(to_lower_ascii(x)).second)
                output.push_back(x);
        }

        return output;
    }

}  // namespace pwn
