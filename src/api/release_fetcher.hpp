#pragma once

#include "api/http_client.hpp"
#include "core/update_types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

struct ReleaseFetcherOptions {
    std::string api_base = "https://api.github.com";
    std::string repo = "nazeefmasood/youtube-downloader-gui";
    std::string user_agent = "VidGrab-Updater";
    std::vector<std::string> tokens;  // tried in order on 401/403/404
    std::chrono::milliseconds timeout = std::chrono::seconds(30);
};

struct FetchResult {
    bool success = false;
    ReleaseDescriptor release;
    UpdateError error;
};

/// Client for the release registry's "latest release" endpoint
class ReleaseFetcher {
public:
    ReleaseFetcher(HttpClient& http, ReleaseFetcherOptions options);
    ~ReleaseFetcher();

    /// GET <api_base>/repos/<repo>/releases/latest with credential fallback
    FetchResult fetch_latest() const;

    std::string latest_release_url() const;

    /// Parse a GitHub release JSON document. Returns false with `error` set on
    /// malformed input.
    static bool parse_release(const std::string& json_text,
                              ReleaseDescriptor& release,
                              std::string& error);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
