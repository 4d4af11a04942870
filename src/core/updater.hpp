#pragma once

#include "api/http_client.hpp"
#include "api/release_fetcher.hpp"
#include "core/asset_selector.hpp"
#include "core/file_transfer.hpp"
#include "core/installer.hpp"
#include "core/update_types.hpp"
#include "platform/desktop.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

enum class UpdateState {
    Idle,
    Checking,
    Available,
    NotAvailable,
    Downloading,
    Downloaded,
    Cancelled,
    Installing,
    Error
};

const char* state_name(UpdateState state);

/// Snapshot of the coordinator, flattened for display
struct UpdateStatus {
    UpdateState state = UpdateState::Idle;
    bool checking = false;
    bool available = false;
    bool downloading = false;
    bool downloaded = false;
    std::string error;
    UpdateErrorKind error_kind = UpdateErrorKind::None;
    std::optional<UpdateInfo> info;
    std::optional<UpdateProgress> progress;
    std::string downloaded_path;
};

enum class UpdateEventType {
    Checking,
    Available,
    NotAvailable,
    DownloadStart,
    Progress,
    Downloaded,
    Error,
    Cancelled,
    LinuxDeb,
    LinuxAppImage
};

/// "checking", "available", "not-available", "progress", "linux-deb", ...
const char* event_name(UpdateEventType type);

struct UpdateEvent {
    UpdateEventType type = UpdateEventType::Checking;
    std::optional<UpdateInfo> info;
    std::optional<UpdateProgress> progress;
    std::string path;
    std::string message;
};

using UpdateListener = std::function<void(const UpdateEvent&)>;

struct UpdaterOptions {
    std::string current_version;  // empty = compiled-in version
    PlatformInfo platform = detect_platform();
    ReleaseFetcherOptions fetch;
    TransferOptions transfer;
    std::chrono::milliseconds quit_grace = std::chrono::milliseconds(1000);
};

/// Drives check -> download -> install and owns the single update lifecycle.
/// Thread-safe; network and disk work run on the calling thread without the
/// state lock held. Listeners are invoked without internal locks held.
class Updater {
public:
    Updater(HttpClient& http, Desktop& desktop, UpdaterOptions options);
    ~Updater();

    Updater(const Updater&) = delete;
    Updater& operator=(const Updater&) = delete;

    /// Fetch the latest release and decide whether it is newer.
    /// Returns the update descriptor when one is available.
    std::optional<UpdateInfo> check_for_updates();

    /// Download the artifact of the last available update.
    /// Returns the local path on success.
    std::optional<std::string> download_update();

    /// Hand the downloaded artifact to the platform installer
    bool install_update();

    /// Abort the in-flight download, if any
    void cancel_download();

    UpdateStatus get_status() const;

    ChangelogEntry parse_changelog(const std::string& body, const std::string& version) const;

    /// Back to Idle; forgets info, progress, error and the downloaded path
    /// (the file itself stays on disk)
    void reset();

    int add_listener(UpdateListener listener);
    void remove_listener(int id);

    /// Heuristic: notes mention "mandatory update" or "critical security"
    static bool is_mandatory(const std::string& release_notes);

    /// Compiled-in application version
    static std::string current_version();

    const UpdaterOptions& options() const { return options_; }

private:
    struct Idle {};
    struct Checking {};
    struct Available { UpdateInfo info; };
    struct NotAvailable { std::string latest_version; };
    struct Downloading { UpdateInfo info; UpdateProgress progress; };
    struct Downloaded { UpdateInfo info; std::string path; };
    struct Cancelled { UpdateInfo info; };
    struct Installing { UpdateInfo info; std::string path; };
    struct Failed { UpdateError error; std::optional<UpdateInfo> info; };

    using State = std::variant<Idle, Checking, Available, NotAvailable, Downloading,
                               Downloaded, Cancelled, Installing, Failed>;

    static UpdateState state_of(const State& state);

    /// Info kept from the last successful check, if the state still carries it
    const UpdateInfo* retained_info() const;
    bool busy() const;

    void emit(const UpdateEvent& event);

    UpdaterOptions options_;
    ReleaseFetcher fetcher_;
    FileTransferEngine transfer_;
    Installer installer_;

    mutable std::mutex mutex_;
    State state_;
    uint64_t generation_ = 0;  // bumped on every transition that orphans in-flight work
    std::shared_ptr<std::atomic<bool>> cancel_flag_;
    bool transfer_active_ = false;  // a transfer thread still owns its file, even after cancel/reset

    std::mutex listeners_mutex_;
    std::map<int, UpdateListener> listeners_;
    int next_listener_id_ = 1;
};
