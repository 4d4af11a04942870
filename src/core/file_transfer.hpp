#pragma once

#include "api/http_client.hpp"
#include "core/update_types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <string>

struct TransferOptions {
    std::string download_dir;
    std::string user_agent = "VidGrab-Updater";
    std::chrono::milliseconds timeout = std::chrono::seconds(300);
    int max_redirects = 10;
    std::chrono::milliseconds speed_sample_interval = std::chrono::milliseconds(500);
};

struct TransferResult {
    bool success = false;
    std::string path;    // final file on success, last partial path otherwise
    int redirects = 0;
    UpdateError error;
};

using ProgressCallback = std::function<void(const UpdateProgress&)>;

/// Streams a remote artifact into the download directory.
class FileTransferEngine {
public:
    FileTransferEngine(HttpClient& http, TransferOptions options);

    /// Download `url`, following redirects up to max_redirects.
    /// `cancel_flag` is polled at every chunk and before each redirect.
    /// The partial file is removed on any failure.
    TransferResult download(const std::string& url,
                            const ProgressCallback& on_progress = nullptr,
                            const std::atomic<bool>* cancel_flag = nullptr) const;

    /// Local filename for a URL: "filename" query parameter, then the
    /// filename token of "response-content-disposition", then the last path
    /// segment if shorter than 100 chars, else "update".
    static std::string derive_filename(const std::string& url);

    std::string destination_for(const std::string& url) const;

    const TransferOptions& options() const { return options_; }

private:
    using Clock = std::chrono::steady_clock;

    TransferResult attempt(const std::string& url,
                           const ProgressCallback& on_progress,
                           const std::atomic<bool>* cancel_flag,
                           Clock::time_point deadline,
                           int redirects) const;

    HttpClient& http_;
    TransferOptions options_;
};
