#pragma once

#include "api/http_client.hpp"

#include <string>

/// HttpClient backed by cpp-httplib (HTTPS through OpenSSL)
class HttplibClient : public HttpClient {
public:
    explicit HttplibClient(std::chrono::seconds connect_timeout = std::chrono::seconds(15));

    HttpResult get(const std::string& url,
                   const HttpHeaders& headers,
                   std::chrono::milliseconds timeout,
                   const ResponseHandler& on_response,
                   const ContentReceiver& on_content) override;

private:
    std::chrono::seconds connect_timeout_;
};
