#include "core/file_transfer.hpp"
#include "api/url.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <regex>
#include <system_error>

namespace fs = std::filesystem;

static const char* kDefaultFilename = "update";

/// Strip directory components so a crafted name cannot escape the download dir
static std::string sanitize_filename(const std::string& name) {
    auto slash = name.find_last_of("/\\");
    std::string base = (slash == std::string::npos) ? name : name.substr(slash + 1);
    if (base == "." || base == "..") return "";
    return base;
}

static void remove_partial(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("[FileTransfer] Could not remove partial file {}: {}", path, ec.message());
    }
}

// ════════════════════════════════════════════════════════════════
// Speed sampling
// ════════════════════════════════════════════════════════════════

/// Rate resampled on a fixed wall-clock interval; the previous rate is
/// reported unchanged between samples.
class SpeedSampler {
public:
    explicit SpeedSampler(std::chrono::milliseconds interval)
        : interval_(interval), last_time_(std::chrono::steady_clock::now()) {}

    int64_t update(int64_t transferred) {
        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_time_);
        if (elapsed >= interval_ && elapsed.count() > 0) {
            rate_ = (transferred - last_bytes_) * 1000 / elapsed.count();
            last_bytes_ = transferred;
            last_time_ = now;
        }
        return rate_;
    }

private:
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point last_time_;
    int64_t last_bytes_ = 0;
    int64_t rate_ = 0;
};

// ════════════════════════════════════════════════════════════════
// FileTransferEngine
// ════════════════════════════════════════════════════════════════

FileTransferEngine::FileTransferEngine(HttpClient& http, TransferOptions options)
    : http_(http), options_(std::move(options)) {}

std::string FileTransferEngine::derive_filename(const std::string& url) {
    // Signed blob-storage URLs carry the real name in the query string
    if (auto param = query_param(url, "filename")) {
        std::string name = sanitize_filename(*param);
        if (!name.empty()) return name;
    }

    if (auto disposition = query_param(url, "response-content-disposition")) {
        static const std::regex filename_re(R"re(filename="?([^";]+)"?)re", std::regex::icase);
        std::smatch match;
        if (std::regex_search(*disposition, match, filename_re)) {
            std::string name = sanitize_filename(match[1].str());
            if (!name.empty()) return name;
        }
    }

    auto parts = parse_url(url);
    std::string last = url_decode(parts.path.substr(parts.path.find_last_of('/') + 1));
    last = sanitize_filename(last);
    if (!last.empty() && last.size() < 100) {
        return last;
    }

    return kDefaultFilename;
}

std::string FileTransferEngine::destination_for(const std::string& url) const {
    return (fs::path(options_.download_dir) / derive_filename(url)).string();
}

TransferResult FileTransferEngine::download(const std::string& url,
                                            const ProgressCallback& on_progress,
                                            const std::atomic<bool>* cancel_flag) const {
    return attempt(url, on_progress, cancel_flag, Clock::now() + options_.timeout, 0);
}

TransferResult FileTransferEngine::attempt(const std::string& url,
                                           const ProgressCallback& on_progress,
                                           const std::atomic<bool>* cancel_flag,
                                           Clock::time_point deadline,
                                           int redirects) const {
    TransferResult result;
    result.redirects = redirects;
    result.path = destination_for(url);

    auto cancelled = [cancel_flag] { return cancel_flag && cancel_flag->load(); };

    if (cancelled()) {
        result.error = {UpdateErrorKind::Cancelled, 0, "Download cancelled"};
        return result;
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (remaining.count() <= 0) {
        result.error = {UpdateErrorKind::Timeout, 0, "Download timeout"};
        return result;
    }

    std::error_code ec;
    if (!options_.download_dir.empty()) {
        fs::create_directories(options_.download_dir, ec);
        if (ec) {
            result.error = {UpdateErrorKind::Io, 0,
                            "Cannot create download directory: " + ec.message()};
            return result;
        }
    }

    std::ofstream out(result.path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        result.error = {UpdateErrorKind::Io, 0, "Cannot open " + result.path + " for writing"};
        return result;
    }

    spdlog::debug("[FileTransfer] GET {} -> {}", url, result.path);

    int64_t total_bytes = 0;
    int64_t received_bytes = 0;
    bool aborted_by_cancel = false;
    bool write_failed = false;
    SpeedSampler sampler(options_.speed_sample_interval);

    HttpHeaders headers = {
        {"User-Agent", options_.user_agent},
    };

    auto response_handler = [&](const HttpResponseHead& head) -> bool {
        if (cancelled()) {
            aborted_by_cancel = true;
            return false;
        }
        std::string length = head.header("content-length");
        if (!length.empty()) {
            try {
                total_bytes = std::stoll(length);
            } catch (const std::exception&) {
                total_bytes = 0;
            }
        }
        // Only a 200 body is written; anything else is handled after return
        return head.status == 200;
    };

    auto content_receiver = [&](const char* data, size_t data_length) -> bool {
        if (cancelled()) {
            aborted_by_cancel = true;
            return false;
        }

        out.write(data, static_cast<std::streamsize>(data_length));
        if (!out.good()) {
            write_failed = true;
            return false;
        }
        received_bytes += static_cast<int64_t>(data_length);

        if (on_progress) {
            UpdateProgress progress;
            progress.transferred = received_bytes;
            progress.total = total_bytes;
            if (total_bytes > 0) {
                progress.percent = static_cast<int>(
                    std::clamp<int64_t>(received_bytes * 100 / total_bytes, 0, 100));
            }
            progress.bytes_per_second = sampler.update(received_bytes);
            on_progress(progress);
        }
        return true;
    };

    HttpResult res = http_.get(url, headers, remaining, response_handler, content_receiver);
    out.close();

    if (aborted_by_cancel) {
        remove_partial(result.path);
        spdlog::info("[FileTransfer] Download of {} cancelled", url);
        result.error = {UpdateErrorKind::Cancelled, 0, "Download cancelled"};
        return result;
    }

    if (write_failed) {
        remove_partial(result.path);
        result.error = {UpdateErrorKind::Io, 0, "Failed to write " + result.path};
        return result;
    }

    if (res.error == TransportError::Timeout) {
        remove_partial(result.path);
        spdlog::error("[FileTransfer] Download of {} timed out", url);
        result.error = {UpdateErrorKind::Timeout, 0, "Download timeout"};
        return result;
    }

    if (res.head_received && res.head.status != 200) {
        remove_partial(result.path);
        const int status = res.head.status;
        std::string location = res.head.header("location");

        if (status >= 300 && status < 400 && !location.empty()) {
            if (redirects >= options_.max_redirects) {
                spdlog::error("[FileTransfer] Redirect limit ({}) reached at {}",
                              options_.max_redirects, url);
                result.error = {UpdateErrorKind::Http, status, "Too many redirects"};
                return result;
            }
            std::string next = resolve_location(url, location);
            spdlog::debug("[FileTransfer] {} redirect -> {}", status, next);
            return attempt(next, on_progress, cancel_flag, deadline, redirects + 1);
        }

        spdlog::error("[FileTransfer] Download of {} failed with status {}", url, status);
        result.error = {UpdateErrorKind::Http, status,
                        "Download failed with status " + std::to_string(status)};
        return result;
    }

    if (res.error != TransportError::None) {
        remove_partial(result.path);
        spdlog::error("[FileTransfer] Download of {} failed: {}", url, res.error_message);
        result.error = {UpdateErrorKind::Network, 0, "Download failed: " + res.error_message};
        return result;
    }

    if (!res.head_received) {
        remove_partial(result.path);
        result.error = {UpdateErrorKind::Network, 0, "Download failed: no response"};
        return result;
    }

    if (total_bytes > 0 && received_bytes != total_bytes) {
        remove_partial(result.path);
        result.error = {UpdateErrorKind::Network, 0,
                        "Download incomplete: received " + std::to_string(received_bytes) +
                        " of " + std::to_string(total_bytes) + " bytes"};
        return result;
    }

    spdlog::info("[FileTransfer] Downloaded {} bytes to {}", received_bytes, result.path);
    result.success = true;
    return result;
}
