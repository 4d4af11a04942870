#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

enum class TransportError {
    None,
    Connection,  // DNS, connect, TLS or read failure
    Timeout,     // request deadline elapsed
    Canceled     // a handler returned false
};

struct HttpResponseHead {
    int status = 0;
    std::map<std::string, std::string> headers;  // keys lowercased

    std::string header(const std::string& lower_name) const {
        auto it = headers.find(lower_name);
        return it == headers.end() ? std::string() : it->second;
    }
};

struct HttpResult {
    TransportError error = TransportError::None;
    std::string error_message;
    HttpResponseHead head;   // filled once the status line arrived, even if canceled
    bool head_received = false;
};

/// Called once per response with status and headers.
/// Return false to stop before the body is read.
using ResponseHandler = std::function<bool(const HttpResponseHead&)>;

/// Called for every body chunk. Return false to abort the transfer.
using ContentReceiver = std::function<bool(const char* data, size_t length)>;

/// Minimal GET transport. Redirects are never followed; 3xx responses are
/// handed to the caller like any other status.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /// Streaming GET bounded by an absolute deadline of `timeout` from the call.
    virtual HttpResult get(const std::string& url,
                           const HttpHeaders& headers,
                           std::chrono::milliseconds timeout,
                           const ResponseHandler& on_response,
                           const ContentReceiver& on_content) = 0;

    /// Buffered GET built on the streaming primitive.
    HttpResult get_body(const std::string& url,
                        const HttpHeaders& headers,
                        std::chrono::milliseconds timeout,
                        std::string& body);
};
