#include "api/httplib_client.hpp"
#include "api/url.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

using Clock = std::chrono::steady_clock;

HttplibClient::HttplibClient(std::chrono::seconds connect_timeout)
    : connect_timeout_(connect_timeout) {}

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

HttpResult HttplibClient::get(const std::string& url,
                              const HttpHeaders& headers,
                              std::chrono::milliseconds timeout,
                              const ResponseHandler& on_response,
                              const ContentReceiver& on_content) {
    HttpResult result;

    auto parts = parse_url(url);
    if (parts.host.empty() || (parts.scheme != "https" && parts.scheme != "http")) {
        result.error = TransportError::Connection;
        result.error_message = "Invalid URL: " + url;
        return result;
    }

    const auto deadline = Clock::now() + timeout;
    bool deadline_hit = false;

    httplib::Headers request_headers;
    for (const auto& h : headers) {
        request_headers.emplace(h.first, h.second);
    }

    auto response_handler = [&](const httplib::Response& response) -> bool {
        result.head_received = true;
        result.head.status = response.status;
        for (const auto& h : response.headers) {
            result.head.headers.emplace(lowercase(h.first), h.second);
        }
        if (Clock::now() >= deadline) {
            deadline_hit = true;
            return false;
        }
        return on_response ? on_response(result.head) : true;
    };

    auto content_receiver = [&](const char* data, size_t data_length) -> bool {
        if (Clock::now() >= deadline) {
            deadline_hit = true;
            return false;
        }
        return on_content ? on_content(data, data_length) : true;
    };

    // The transport's own read timeout races the absolute deadline
    auto read_timeout = std::max<std::chrono::milliseconds>(timeout, std::chrono::milliseconds(1));
    auto connect_timeout = std::min<std::chrono::milliseconds>(read_timeout, connect_timeout_);

    auto run = [&](auto& cli) {
        cli.set_connection_timeout(connect_timeout);
        cli.set_read_timeout(read_timeout);
        cli.set_follow_location(false);
        return cli.Get(parts.target(), request_headers, response_handler, content_receiver);
    };

    try {
        auto res = [&]() -> httplib::Result {
            if (parts.scheme == "https") {
                httplib::SSLClient cli(parts.host, parts.port);
                return run(cli);
            }
            httplib::Client cli(parts.host, parts.port);
            return run(cli);
        }();

        if (res) {
            return result;
        }

        if (deadline_hit || Clock::now() >= deadline) {
            result.error = TransportError::Timeout;
            result.error_message = "Request timed out";
        } else if (res.error() == httplib::Error::Canceled) {
            result.error = TransportError::Canceled;
            result.error_message = "Request canceled";
        } else {
            result.error = TransportError::Connection;
            result.error_message = httplib::to_string(res.error());
        }
    } catch (const std::exception& e) {
        spdlog::error("[HttpClient] GET {} failed: {}", url, e.what());
        result.error = TransportError::Connection;
        result.error_message = e.what();
    }

    return result;
}
