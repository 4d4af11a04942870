#include "core/updater.hpp"
#include "core/changelog.hpp"
#include "core/version.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#include <vector>

#ifndef VIDGRAB_APP_VERSION
#define VIDGRAB_APP_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;

const char* state_name(UpdateState state) {
    switch (state) {
        case UpdateState::Idle:         return "idle";
        case UpdateState::Checking:     return "checking";
        case UpdateState::Available:    return "available";
        case UpdateState::NotAvailable: return "not-available";
        case UpdateState::Downloading:  return "downloading";
        case UpdateState::Downloaded:   return "downloaded";
        case UpdateState::Cancelled:    return "cancelled";
        case UpdateState::Installing:   return "installing";
        case UpdateState::Error:        return "error";
    }
    return "unknown";
}

const char* event_name(UpdateEventType type) {
    switch (type) {
        case UpdateEventType::Checking:      return "checking";
        case UpdateEventType::Available:     return "available";
        case UpdateEventType::NotAvailable:  return "not-available";
        case UpdateEventType::DownloadStart: return "download-start";
        case UpdateEventType::Progress:      return "progress";
        case UpdateEventType::Downloaded:    return "downloaded";
        case UpdateEventType::Error:         return "error";
        case UpdateEventType::Cancelled:     return "cancelled";
        case UpdateEventType::LinuxDeb:      return "linux-deb";
        case UpdateEventType::LinuxAppImage: return "linux-appimage";
    }
    return "unknown";
}

static UpdateEvent make_event(UpdateEventType type) {
    UpdateEvent e;
    e.type = type;
    return e;
}

static UpdateEvent error_event(const std::string& message) {
    UpdateEvent e = make_event(UpdateEventType::Error);
    e.message = message;
    return e;
}

// ════════════════════════════════════════════════════════════════
// Updater
// ════════════════════════════════════════════════════════════════

static UpdaterOptions with_defaults(UpdaterOptions options) {
    if (options.current_version.empty()) {
        options.current_version = Updater::current_version();
    }
    if (options.transfer.download_dir.empty()) {
        options.transfer.download_dir = SystemDesktop::downloads_dir();
    }
    options.platform = make_platform(options.platform.os, options.platform.arch);
    return options;
}

Updater::Updater(HttpClient& http, Desktop& desktop, UpdaterOptions options)
    : options_(with_defaults(std::move(options))),
      fetcher_(http, options_.fetch),
      transfer_(http, options_.transfer),
      installer_(desktop, options_.platform, options_.quit_grace),
      state_(Idle{}) {}

Updater::~Updater() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancel_flag_) cancel_flag_->store(true);
}

std::string Updater::current_version() {
    return VIDGRAB_APP_VERSION;
}

bool Updater::is_mandatory(const std::string& release_notes) {
    std::string lower = release_notes;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("mandatory update") != std::string::npos ||
           lower.find("critical security") != std::string::npos;
}

UpdateState Updater::state_of(const State& state) {
    switch (state.index()) {
        case 0: return UpdateState::Idle;
        case 1: return UpdateState::Checking;
        case 2: return UpdateState::Available;
        case 3: return UpdateState::NotAvailable;
        case 4: return UpdateState::Downloading;
        case 5: return UpdateState::Downloaded;
        case 6: return UpdateState::Cancelled;
        case 7: return UpdateState::Installing;
        default: return UpdateState::Error;
    }
}

const UpdateInfo* Updater::retained_info() const {
    if (auto* s = std::get_if<Available>(&state_)) return &s->info;
    if (auto* s = std::get_if<Cancelled>(&state_)) return &s->info;
    if (auto* s = std::get_if<Failed>(&state_)) return s->info ? &*s->info : nullptr;
    return nullptr;
}

bool Updater::busy() const {
    return std::holds_alternative<Checking>(state_) ||
           std::holds_alternative<Downloading>(state_) ||
           std::holds_alternative<Installing>(state_);
}

// ── Events ──────────────────────────────────────────────────

int Updater::add_listener(UpdateListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    int id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void Updater::remove_listener(int id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(id);
}

void Updater::emit(const UpdateEvent& event) {
    std::vector<UpdateListener> snapshot;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& entry : listeners_) {
            snapshot.push_back(entry.second);
        }
    }
    for (const auto& listener : snapshot) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            spdlog::error("[Updater] Listener for '{}' threw: {}", event_name(event.type), e.what());
        }
    }
}

// ── Check ───────────────────────────────────────────────────

std::optional<UpdateInfo> Updater::check_for_updates() {
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (busy()) {
            spdlog::warn("[Updater] Check ignored while {}", state_name(state_of(state_)));
            return std::nullopt;
        }
        state_ = Checking{};
        generation = ++generation_;
    }
    spdlog::info("[Updater] Checking for updates (current {})", options_.current_version);
    emit(make_event(UpdateEventType::Checking));

    FetchResult fetched = fetcher_.fetch_latest();

    std::optional<UpdateInfo> found;
    UpdateEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            spdlog::debug("[Updater] Discarding check result after reset");
            return std::nullopt;
        }

        if (!fetched.success) {
            state_ = Failed{fetched.error, std::nullopt};
            event = error_event(fetched.error.message);
        } else if (!is_newer_version(options_.current_version, fetched.release.version)) {
            spdlog::info("[Updater] Up to date (latest {})", fetched.release.version);
            state_ = NotAvailable{fetched.release.version};
            event = make_event(UpdateEventType::NotAvailable);
        } else {
            auto asset = select_asset(fetched.release.assets, options_.platform);
            if (!asset) {
                UpdateError error{UpdateErrorKind::NoAsset, 0,
                                  "No suitable download found for your platform"};
                state_ = Failed{error, std::nullopt};
                event = error_event(error.message);
            } else {
                UpdateInfo info;
                info.version = fetched.release.version;
                info.current_version = options_.current_version;
                info.release_date = fetched.release.published_at;
                info.release_notes = fetched.release.body;
                info.download_url = asset->download_url;
                info.mandatory = is_mandatory(fetched.release.body);

                spdlog::info("[Updater] Update available: v{}{}", info.version,
                             info.mandatory ? " (mandatory)" : "");
                state_ = Available{info};
                event = make_event(UpdateEventType::Available);
                event.info = info;
                found = std::move(info);
            }
        }
    }

    if (event.type == UpdateEventType::Error) {
        spdlog::error("[Updater] Update check failed: {}", event.message);
    }
    emit(event);
    return found;
}

// ── Download ────────────────────────────────────────────────

std::optional<std::string> Updater::download_update() {
    UpdateInfo info;
    uint64_t generation;
    std::shared_ptr<std::atomic<bool>> cancel_flag;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (busy()) {
            spdlog::warn("[Updater] Download ignored while {}", state_name(state_of(state_)));
            return std::nullopt;
        }
        if (transfer_active_) {
            spdlog::warn("[Updater] Download ignored while the previous transfer winds down");
            return std::nullopt;
        }
        if (auto* done = std::get_if<Downloaded>(&state_)) {
            spdlog::info("[Updater] Update already downloaded to {}", done->path);
            return done->path;
        }

        const UpdateInfo* retained = retained_info();
        if (!retained) {
            UpdateError error{UpdateErrorKind::InvalidState, 0, "No update available to download"};
            state_ = Failed{error, std::nullopt};
            lock.unlock();
            spdlog::error("[Updater] {}", error.message);
            emit(error_event(error.message));
            return std::nullopt;
        }

        info = *retained;
        cancel_flag = std::make_shared<std::atomic<bool>>(false);
        cancel_flag_ = cancel_flag;
        transfer_active_ = true;
        state_ = Downloading{info, UpdateProgress{}};
        generation = ++generation_;
    }

    spdlog::info("[Updater] Downloading {}", info.download_url);
    UpdateEvent start = make_event(UpdateEventType::DownloadStart);
    start.info = info;
    emit(start);

    auto on_progress = [this, generation](const UpdateProgress& progress) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation != generation_) return;
            if (auto* d = std::get_if<Downloading>(&state_)) {
                d->progress = progress;
            }
        }
        UpdateEvent e = make_event(UpdateEventType::Progress);
        e.progress = progress;
        emit(e);
    };

    TransferResult result = transfer_.download(info.download_url, on_progress, cancel_flag.get());

    UpdateEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transfer_active_ = false;
        if (generation != generation_) {
            // Cancelled or reset while in flight; nothing of this transfer may remain
            std::error_code ec;
            fs::remove(result.path, ec);
            return std::nullopt;
        }
        cancel_flag_.reset();

        if (result.success) {
            state_ = Downloaded{info, result.path};
            event = make_event(UpdateEventType::Downloaded);
            event.path = result.path;
        } else if (result.error.kind == UpdateErrorKind::Cancelled) {
            state_ = Cancelled{info};
            event = make_event(UpdateEventType::Cancelled);
        } else {
            state_ = Failed{result.error, info};
            event = error_event(result.error.message);
        }
    }

    if (result.success) {
        spdlog::info("[Updater] Update downloaded to {}", result.path);
    } else if (event.type == UpdateEventType::Error) {
        spdlog::error("[Updater] Update download failed: {}", result.error.message);
    }
    emit(event);

    if (!result.success) return std::nullopt;
    return result.path;
}

void Updater::cancel_download() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* downloading = std::get_if<Downloading>(&state_);
        if (!downloading) return;

        if (cancel_flag_) cancel_flag_->store(true);
        cancel_flag_.reset();
        UpdateInfo info = downloading->info;
        state_ = Cancelled{std::move(info)};
        ++generation_;
    }
    spdlog::info("[Updater] Download cancelled");
    emit(make_event(UpdateEventType::Cancelled));
}

// ── Install ─────────────────────────────────────────────────

bool Updater::install_update() {
    std::string path;
    UpdateInfo info;
    uint64_t generation;
    const bool desktop_install = options_.platform.os == "windows" || options_.platform.os == "darwin";
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto* downloaded = std::get_if<Downloaded>(&state_);
        if (!downloaded) {
            std::string message = "No update downloaded";
            if (!busy()) {
                std::optional<UpdateInfo> keep;
                if (auto* retained = retained_info()) keep = *retained;
                state_ = Failed{UpdateError{UpdateErrorKind::InvalidState, 0, message}, keep};
            }
            lock.unlock();
            spdlog::error("[Updater] {}", message);
            emit(error_event(message));
            return false;
        }

        path = downloaded->path;
        info = downloaded->info;
        if (desktop_install) {
            state_ = Installing{info, path};
        }
        generation = ++generation_;
    }

    InstallResult result = installer_.install(path);

    UpdateEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!result.success) {
            if (generation == generation_) {
                state_ = Failed{result.error, info};
            }
            event = error_event(result.error.message);
        } else if (result.outcome == InstallOutcome::LinuxDeb) {
            event = make_event(UpdateEventType::LinuxDeb);
            event.path = path;
        } else if (result.outcome == InstallOutcome::LinuxAppImage) {
            event = make_event(UpdateEventType::LinuxAppImage);
            event.path = path;
        } else {
            // Installer launched; the application is on its way out
            return true;
        }
    }

    emit(event);
    return result.success;
}

// ── Status / misc ───────────────────────────────────────────

UpdateStatus Updater::get_status() const {
    std::lock_guard<std::mutex> lock(mutex_);

    UpdateStatus status;
    status.state = state_of(state_);

    if (std::holds_alternative<Checking>(state_)) {
        status.checking = true;
    } else if (auto* s = std::get_if<Available>(&state_)) {
        status.available = true;
        status.info = s->info;
    } else if (auto* s = std::get_if<Downloading>(&state_)) {
        status.available = true;
        status.downloading = true;
        status.info = s->info;
        status.progress = s->progress;
    } else if (auto* s = std::get_if<Downloaded>(&state_)) {
        status.available = true;
        status.downloaded = true;
        status.info = s->info;
        status.downloaded_path = s->path;
    } else if (auto* s = std::get_if<Cancelled>(&state_)) {
        status.available = true;
        status.info = s->info;
    } else if (auto* s = std::get_if<Installing>(&state_)) {
        status.available = true;
        status.downloaded = true;
        status.info = s->info;
        status.downloaded_path = s->path;
    } else if (auto* s = std::get_if<Failed>(&state_)) {
        status.error = s->error.message;
        status.error_kind = s->error.kind;
        status.info = s->info;
        status.available = s->info.has_value();
    }

    return status;
}

ChangelogEntry Updater::parse_changelog(const std::string& body, const std::string& version) const {
    ChangelogEntry entry;
    entry.version = version;
    entry.date = iso8601_now();
    entry.sections = parse_changelog_sections(body);
    return entry;
}

void Updater::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancel_flag_) cancel_flag_->store(true);
    cancel_flag_.reset();
    state_ = Idle{};
    ++generation_;
    spdlog::debug("[Updater] Reset");
}
