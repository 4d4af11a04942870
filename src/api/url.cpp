#include "api/url.hpp"

#include <cctype>

std::string UrlParts::target() const {
    if (query.empty()) return path;
    return path + "?" + query;
}

std::string UrlParts::origin() const {
    std::string out = scheme + "://" + host;
    bool default_port = (scheme == "https" && port == 443) || (scheme == "http" && port == 80);
    if (!default_port) {
        out += ":" + std::to_string(port);
    }
    return out;
}

UrlParts parse_url(const std::string& url) {
    UrlParts parts;
    auto pos = url.find("://");
    if (pos == std::string::npos) {
        return parts;
    }

    parts.scheme = url.substr(0, pos);
    for (auto& c : parts.scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    auto rest = url.substr(pos + 3);
    auto fragment = rest.find('#');
    if (fragment != std::string::npos) {
        rest = rest.substr(0, fragment);
    }

    auto path_pos = rest.find_first_of("/?");
    if (path_pos != std::string::npos) {
        parts.host = rest.substr(0, path_pos);
        rest = rest.substr(path_pos);
    } else {
        parts.host = rest;
        rest.clear();
    }

    auto q = rest.find('?');
    if (q != std::string::npos) {
        parts.path = rest.substr(0, q);
        parts.query = rest.substr(q + 1);
    } else {
        parts.path = rest;
    }
    if (parts.path.empty()) parts.path = "/";

    auto colon = parts.host.find(':');
    if (colon != std::string::npos) {
        try {
            parts.port = std::stoi(parts.host.substr(colon + 1));
        } catch (const std::exception&) {
            parts.port = (parts.scheme == "https") ? 443 : 80;
        }
        parts.host = parts.host.substr(0, colon);
    } else {
        parts.port = (parts.scheme == "https") ? 443 : 80;
    }
    return parts;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
            } else {
                out += c;
            }
        } else {
            out += c;
        }
    }
    return out;
}

std::optional<std::string> query_param(const std::string& url, const std::string& name) {
    auto parts = parse_url(url);
    const std::string& query = parts.query;

    size_t start = 0;
    while (start <= query.size()) {
        size_t end = query.find('&', start);
        if (end == std::string::npos) end = query.size();

        std::string pair = query.substr(start, end - start);
        auto eq = pair.find('=');
        std::string key = url_decode(pair.substr(0, eq));
        if (key == name) {
            if (eq == std::string::npos) return std::string();
            return url_decode(pair.substr(eq + 1));
        }
        start = end + 1;
    }
    return std::nullopt;
}

std::string resolve_location(const std::string& base_url, const std::string& location) {
    if (location.find("://") != std::string::npos) {
        return location;
    }

    auto base = parse_url(base_url);
    if (location.rfind("//", 0) == 0) {
        return base.scheme + ":" + location;
    }
    if (!location.empty() && location[0] == '/') {
        return base.origin() + location;
    }

    // Relative to the directory of the current path
    std::string dir = base.path;
    auto slash = dir.rfind('/');
    dir = (slash == std::string::npos) ? "/" : dir.substr(0, slash + 1);
    return base.origin() + dir + location;
}
