#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>


namespace pwn {

    using HttpHeaders = std::vector<std::pair<std::string, std::string>>;


    struct HttpResponse {
        // 0 when the transfer itself failed, see `error_`
        long status_ = 0;
        std::string body_;
        std::string error_;
    };


    struct HttpClientOptions {
        double timeout_sec_ = 30.0;
        double connect_timeout_sec_ = 10.0;
    };


    class IHttpClient {

    public:
        virtual ~IHttpClient() = default;

        virtual HttpResponse get(
            const std::string& url, const HttpHeaders& headers
        ) = 0;
    };


    // A single connection and cookie context shared by every request
    // made through the returned client
    std::unique_ptr<IHttpClient> create_http_client_curl(
        const HttpClientOptions& options
    );

}  // namespace pwn
