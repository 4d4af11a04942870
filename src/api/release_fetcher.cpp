#include "api/release_fetcher.hpp"
#include "core/version.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

using json = nlohmann::json;

static const char* kTimeoutMessage =
    "Update check timed out. Please check your internet connection.";
static const char* kRateLimitMessage =
    "GitHub API rate limited. Please try again later.";

struct ReleaseFetcher::Impl {
    HttpClient& http;
    ReleaseFetcherOptions options;

    Impl(HttpClient& h, ReleaseFetcherOptions o) : http(h), options(std::move(o)) {}

    HttpHeaders headers_for(const std::string* token) const {
        HttpHeaders headers = {
            {"User-Agent", options.user_agent},
            {"Accept", "application/vnd.github.v3+json"},
        };
        if (token) {
            headers.emplace_back("Authorization", "Bearer " + *token);
        }
        return headers;
    }
};

ReleaseFetcher::ReleaseFetcher(HttpClient& http, ReleaseFetcherOptions options)
    : impl_(std::make_unique<Impl>(http, std::move(options))) {}

ReleaseFetcher::~ReleaseFetcher() = default;

std::string ReleaseFetcher::latest_release_url() const {
    std::string base = impl_->options.api_base;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/repos/" + impl_->options.repo + "/releases/latest";
}

/// Null-tolerant string read
static std::string json_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

bool ReleaseFetcher::parse_release(const std::string& json_text,
                                   ReleaseDescriptor& release,
                                   std::string& error) {
    json j = json::parse(json_text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        error = "Failed to parse GitHub response";
        return false;
    }

    release.tag_name = json_string(j, "tag_name");
    if (release.tag_name.empty()) {
        error = "Invalid release format: missing tag_name";
        return false;
    }
    release.version = strip_version_prefix(release.tag_name);
    release.published_at = json_string(j, "published_at");
    release.body = json_string(j, "body");
    release.html_url = json_string(j, "html_url");

    release.assets.clear();
    auto assets = j.find("assets");
    if (assets != j.end() && assets->is_array()) {
        for (const auto& asset : *assets) {
            if (!asset.is_object()) continue;
            AssetInfo ai;
            ai.name = json_string(asset, "name");
            ai.download_url = json_string(asset, "browser_download_url");
            auto size = asset.find("size");
            if (size != asset.end() && size->is_number_integer()) {
                ai.size = size->get<int64_t>();
            }
            if (ai.name.empty() || ai.download_url.empty()) continue;
            release.assets.push_back(std::move(ai));
        }
    }
    return true;
}

FetchResult ReleaseFetcher::fetch_latest() const {
    FetchResult result;
    const auto& tokens = impl_->options.tokens;
    const std::string url = latest_release_url();

    // One attempt per configured credential; a single anonymous one if none
    const size_t attempts = std::max<size_t>(1, tokens.size());

    for (size_t i = 0; i < attempts; ++i) {
        const std::string* token = i < tokens.size() ? &tokens[i] : nullptr;
        const bool has_next = i + 1 < attempts;

        std::string body;
        HttpResult res = impl_->http.get_body(url, impl_->headers_for(token),
                                              impl_->options.timeout, body);

        if (res.error == TransportError::Timeout) {
            spdlog::error("[ReleaseFetcher] Timed out fetching {}", url);
            result.error = {UpdateErrorKind::Timeout, 0, kTimeoutMessage};
            return result;
        }
        if (res.error != TransportError::None) {
            spdlog::error("[ReleaseFetcher] Request to {} failed: {}", url, res.error_message);
            result.error = {UpdateErrorKind::Network, 0,
                            "Failed to reach release registry: " + res.error_message};
            return result;
        }

        const int status = res.head.status;

        if (status == 401 || status == 404) {
            if (has_next) {
                spdlog::warn("[ReleaseFetcher] Credential {} returned {}, trying fallback", i, status);
                continue;
            }
            result.error = {status == 401 ? UpdateErrorKind::Auth : UpdateErrorKind::Http, status,
                            "GitHub API returned " + std::to_string(status)};
            spdlog::error("[ReleaseFetcher] {}", result.error.message);
            return result;
        }

        if (status == 403) {
            if (has_next) {
                spdlog::warn("[ReleaseFetcher] Credential {} rate limited, trying fallback", i);
                continue;
            }
            result.error = {UpdateErrorKind::RateLimit, status, kRateLimitMessage};
            spdlog::error("[ReleaseFetcher] {}", result.error.message);
            return result;
        }

        if (status != 200) {
            result.error = {UpdateErrorKind::Http, status,
                            "GitHub API returned " + std::to_string(status)};
            spdlog::error("[ReleaseFetcher] {}", result.error.message);
            return result;
        }

        std::string parse_error;
        if (!parse_release(body, result.release, parse_error)) {
            result.error = {UpdateErrorKind::Parse, status, parse_error};
            spdlog::error("[ReleaseFetcher] {}", parse_error);
            return result;
        }

        spdlog::info("[ReleaseFetcher] Latest release {} ({} assets)",
                     result.release.tag_name, result.release.assets.size());
        result.success = true;
        return result;
    }

    // Unreachable: the loop always returns on its last attempt
    result.error = {UpdateErrorKind::Network, 0, "No release request was made"};
    return result;
}
