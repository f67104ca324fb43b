#include "pwnreport/breach/formatter.hpp"

#include <re2/re2.h>


namespace {

    RE2::Options make_pattern_options() {
        RE2::Options options;
        options.set_case_sensitive(false);
        // Names are taken byte for byte, valid UTF-8 or not
        options.set_encoding(RE2::Options::EncodingLatin1);
        options.set_log_errors(false);
        return options;
    }

    const RE2& name_pattern() {
        static const RE2 pattern{ "\"Name\":\"(.*?)\"",
                                  ::make_pattern_options() };
        return pattern;
    }

}  // namespace


// BreachIndex
namespace pwn {

    void BreachIndex::add(
        const std::string& breach_name, const std::string& email
    ) {
        const auto found = index_.find(breach_name);
        if (index_.end() != found) {
            entries_[found->second].emails_.push_back(email);
            return;
        }

        index_.emplace(breach_name, entries_.size());
        auto& entry = entries_.emplace_back();
        entry.name_ = breach_name;
        entry.emails_.push_back(email);
    }

    const BreachIndex::Entry* BreachIndex::find(
        const std::string& breach_name
    ) const {
        const auto found = index_.find(breach_name);
        if (index_.end() == found)
            return nullptr;
        return &entries_[found->second];
    }

}  // namespace pwn


namespace pwn {

    std::vector<std::string> find_breach_names(std::string_view body) {
        std::vector<std::string> output;

        re2::StringPiece input{ body.data(), body.size() };
        std::string name;
        while (RE2::FindAndConsume(&input, ::name_pattern(), &name)) {
            output.push_back(name);
        }

        return output;
    }

    BreachIndex index_by_breach(const RawResults& results) {
        BreachIndex output;

        for (const auto& entry : results) {
            for (const auto& name : find_breach_names(entry.body_)) {
                output.add(name, entry.email_);
            }
        }

        return output;
    }

}  // namespace pwn
