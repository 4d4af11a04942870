#pragma once

#include <optional>
#include <string>

struct UrlParts {
    std::string scheme;
    std::string host;
    int port = 443;
    std::string path;   // path without query, "/" if absent
    std::string query;  // raw query string without '?'

    /// Path plus "?query" when a query is present
    std::string target() const;
    /// "scheme://host[:port]" with the port omitted when it is the default
    std::string origin() const;
};

/// Split an absolute http(s) URL. Returns an empty host on malformed input.
UrlParts parse_url(const std::string& url);

/// Decode %XX escapes and '+' as space
std::string url_decode(const std::string& s);

/// First value of a query parameter, percent-decoded
std::optional<std::string> query_param(const std::string& url, const std::string& name);

/// Resolve a Location header value against the URL that produced it
std::string resolve_location(const std::string& base_url, const std::string& location);
