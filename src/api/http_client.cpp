#include "api/http_client.hpp"

HttpResult HttpClient::get_body(const std::string& url,
                                const HttpHeaders& headers,
                                std::chrono::milliseconds timeout,
                                std::string& body) {
    body.clear();
    return get(url, headers, timeout, nullptr,
               [&body](const char* data, size_t length) {
                   body.append(data, length);
                   return true;
               });
}
