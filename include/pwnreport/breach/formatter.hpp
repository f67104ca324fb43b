#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "pwnreport/breach/collector.hpp"


namespace pwn {

    // Breach name to affected addresses. Breaches iterate in the order
    // they were first seen.
    class BreachIndex {

    public:
        struct Entry {
            std::string name_;
            std::vector<std::string> emails_;
        };

        void add(const std::string& breach_name, const std::string& email);
        const Entry* find(const std::string& breach_name) const;

        size_t size() const { return entries_.size(); }
        bool empty() const { return entries_.empty(); }

        auto begin() const { return entries_.cbegin(); }
        auto end() const { return entries_.cend(); }

    private:
        std::vector<Entry> entries_;
        std::unordered_map<std::string, size_t> index_;
    };


    // Values of every `"Name":"..."` in the body, case insensitive. No
    // JSON parsing happens here, so truncated bodies still yield whatever
    // names precede the cut and garbage yields nothing.
    std::vector<std::string> find_breach_names(std::string_view body);

    BreachIndex index_by_breach(const RawResults& results);

}  // namespace pwn
