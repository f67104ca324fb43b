#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "pwnreport/common/util.h"
#include "pwnreport/extract/email.hpp"
#include "pwnreport/http/client.hpp"


namespace pwn {

    struct CollectorConfig {
        std::string api_url_;
        std::string user_agent_;
        std::string api_key_header_;
        std::string api_key_;
        double sleep_sec_ = 1.6;
        int fail_threshold_ = 3;
    };


    // Raw response bodies keyed by email address, in insertion order.
    // Setting an address twice replaces its body but keeps its position.
    class RawResults {

    public:
        struct Entry {
            std::string email_;
            std::string body_;
        };

        void set(const std::string& email, std::string body);
        const std::string* find(const std::string& email) const;

        size_t size() const { return entries_.size(); }
        bool empty() const { return entries_.empty(); }

        auto begin() const { return entries_.cbegin(); }
        auto end() const { return entries_.cend(); }

    private:
        std::vector<Entry> entries_;
        std::unordered_map<std::string, size_t> index_;
    };


    struct CollectProgress {
        size_t current_ = 0;  // 1-based
        size_t total_ = 0;
        long status_ = 0;
    };

    using progress_func_t = std::function<void(const CollectProgress&)>;


    class BreachCollector {

    public:
        BreachCollector(
            const CollectorConfig& config, IHttpClient& http, ISleeper& sleeper
        );

        void set_progress_callback(progress_func_t func);

        // Throws RateLimitError once `fail_threshold_` responses came back
        // with anything other than 200 or 404. Nothing collected so far is
        // returned in that case.
        RawResults collect(const EmailList& emails);

        std::string make_url(const std::string& email) const;
        HttpHeaders make_headers() const;

        int failure_count() const { return failures_; }

    private:
        CollectorConfig config_;
        IHttpClient& http_;
        ISleeper& sleeper_;
        progress_func_t progress_;
        int failures_ = 0;
    };

}  // namespace pwn
