#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// ── Release registry data ──────────────────────────────────────

struct AssetInfo {
    std::string name;
    std::string download_url;
    int64_t size = 0;  // bytes
};

struct ReleaseDescriptor {
    std::string tag_name;
    std::string version;       // tag_name without the leading 'v'
    std::string published_at;
    std::string body;          // free-text release notes
    std::string html_url;
    std::vector<AssetInfo> assets;
};

struct PlatformInfo {
    std::string os;    // "windows", "darwin", "linux"
    std::string arch;  // "amd64", "arm64", "armv7", "386", ...
};

// ── Update lifecycle data ──────────────────────────────────────

struct UpdateInfo {
    std::string version;
    std::string current_version;
    std::string release_date;
    std::string release_notes;
    std::string download_url;
    bool mandatory = false;
};

struct UpdateProgress {
    int percent = 0;             // 0-100
    int64_t transferred = 0;     // bytes
    int64_t total = 0;           // 0 if unknown
    int64_t bytes_per_second = 0;
};

enum class UpdateErrorKind {
    None,
    Network,
    Timeout,
    Auth,
    RateLimit,
    Http,
    NoAsset,
    Parse,
    Io,
    Cancelled,
    InvalidState
};

struct UpdateError {
    UpdateErrorKind kind = UpdateErrorKind::None;
    int http_status = 0;
    std::string message;

    explicit operator bool() const { return kind != UpdateErrorKind::None; }
};

const char* error_kind_name(UpdateErrorKind kind);

// ── Changelog data ─────────────────────────────────────────────

struct ChangelogSection {
    std::vector<std::string> added;
    std::vector<std::string> changed;
    std::vector<std::string> fixed;
    std::vector<std::string> removed;

    bool empty() const {
        return added.empty() && changed.empty() && fixed.empty() && removed.empty();
    }
};

struct ChangelogEntry {
    std::string version;
    std::string date;
    ChangelogSection sections;
};
