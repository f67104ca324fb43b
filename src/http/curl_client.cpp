#include "pwnreport/http/client.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include <curl/curl.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "pwnreport/common/util.h"


namespace {

    size_t write_callback(
        char* ptr, size_t size, size_t nmemb, void* userdata
    ) {
        auto& out = *reinterpret_cast<std::string*>(userdata);
        out.append(ptr, size * nmemb);
        return size * nmemb;
    }

    long to_millisec(double seconds) {
        if (!(seconds > 0.0))
            return 0;
        if (seconds > pwn::MAX_WAIT_SEC)
            seconds = pwn::MAX_WAIT_SEC;
        return static_cast<long>(seconds * 1000.0);
    }


    struct SlistDeleter {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };
    using slist_ptr = std::unique_ptr<curl_slist, SlistDeleter>;


    class HttpClientCurl : public pwn::IHttpClient {

    public:
        explicit HttpClientCurl(const pwn::HttpClientOptions& options) {
            if (CURLE_OK != curl_global_init(CURL_GLOBAL_DEFAULT))
                throw std::runtime_error{ "Failed to initialize libcurl" };

            handle_ = curl_easy_init();
            if (nullptr == handle_) {
                curl_global_cleanup();
                throw std::runtime_error{ "Failed to create a curl handle" };
            }

            // Empty file name turns on the in-memory cookie engine
            curl_easy_setopt(handle_, CURLOPT_COOKIEFILE, "");
            curl_easy_setopt(handle_, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
            curl_easy_setopt(
                handle_, CURLOPT_TIMEOUT_MS, ::to_millisec(options.timeout_sec_)
            );
            curl_easy_setopt(
                handle_,
                CURLOPT_CONNECTTIMEOUT_MS,
                ::to_millisec(options.connect_timeout_sec_)
            );
            curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, ::write_callback);
            curl_easy_setopt(handle_, CURLOPT_ERRORBUFFER, error_buf_);
        }

        ~HttpClientCurl() override {
            curl_easy_cleanup(handle_);
            curl_global_cleanup();
        }

        HttpClientCurl(const HttpClientCurl&) = delete;
        HttpClientCurl& operator=(const HttpClientCurl&) = delete;

        pwn::HttpResponse get(
            const std::string& url, const pwn::HttpHeaders& headers
        ) override {
            pwn::HttpResponse response;

            slist_ptr header_list;
            for (const auto& [key, value] : headers) {
                const auto line = fmt::format("{}: {}", key, value);
                auto appended = curl_slist_append(
                    header_list.get(), line.c_str()
                );
                if (nullptr == appended) {
                    response.error_ = "Failed to build request headers";
                    return response;
                }
                header_list.release();
                header_list.reset(appended);
            }

            error_buf_[0] = '\0';
            curl_easy_setopt(handle_, CURLOPT_URL, url.c_str());
            curl_easy_setopt(handle_, CURLOPT_HTTPGET, 1L);
            curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, header_list.get());
            curl_easy_setopt(handle_, CURLOPT_WRITEDATA, &response.body_);

            const auto res = curl_easy_perform(handle_);

            // The list dies with this scope
            curl_easy_setopt(
                handle_, CURLOPT_HTTPHEADER, static_cast<curl_slist*>(nullptr)
            );

            if (CURLE_OK != res) {
                response.error_ = ('\0' != error_buf_[0])
                                      ? std::string{ error_buf_ }
                                      : std::string{ curl_easy_strerror(res) };
                response.body_.clear();
                spdlog::debug("Transfer failed: {}", response.error_);
                return response;
            }

            curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &response.status_);
            return response;
        }

    private:
        CURL* handle_ = nullptr;
        char error_buf_[CURL_ERROR_SIZE] = {};
    };

}  // namespace


namespace pwn {

    std::unique_ptr<IHttpClient> create_http_client_curl(
        const HttpClientOptions& options
    ) {
        return std::make_unique<HttpClientCurl>(options);
    }

}  // namespace pwn
