#include "core/cli.hpp"
#include "core/changelog.hpp"
#include "core/installer.hpp"
#include "api/httplib_client.hpp"
#include "platform/desktop.hpp"
#include "ui/progress_view.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>
#include <signal.h>

static std::atomic<bool> g_interrupted{false};

static void interrupt_handler(int /*sig*/) {
    g_interrupted.store(true);
}

/// Routes SIGINT to Updater::cancel_download for the lifetime of the guard
class InterruptGuard {
public:
    explicit InterruptGuard(Updater& updater) : updater_(updater) {
        g_interrupted.store(false);

        struct sigaction sa;
        sa.sa_handler = interrupt_handler;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        sigaction(SIGINT, &sa, &previous_);

        watcher_ = std::thread([this] {
            while (!done_.load()) {
                if (g_interrupted.exchange(false)) {
                    updater_.cancel_download();
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });
    }

    ~InterruptGuard() {
        done_.store(true);
        if (watcher_.joinable()) watcher_.join();
        sigaction(SIGINT, &previous_, nullptr);
    }

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    Updater& updater_;
    struct sigaction previous_;
    std::atomic<bool> done_{false};
    std::thread watcher_;
};

static void print_list(const char* title, const std::vector<std::string>& items) {
    if (items.empty()) return;
    std::cout << title << ":\n";
    for (const auto& item : items) {
        std::cout << "  - " << item << "\n";
    }
}

static void print_sections(const ChangelogSection& sections) {
    print_list("Added", sections.added);
    print_list("Changed", sections.changed);
    print_list("Fixed", sections.fixed);
    print_list("Removed", sections.removed);
}

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) {
        cmd_help();
        return kExitFailure;
    }

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "check") == 0) {
        return cmd_check();
    }
    if (std::strcmp(cmd, "download") == 0) {
        return cmd_download(false);
    }
    if (std::strcmp(cmd, "install") == 0) {
        return cmd_download(true);
    }
    if (std::strcmp(cmd, "changelog") == 0) {
        return cmd_changelog(argc, argv);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'vidgrab-updater help' for usage.\n";
    return kExitFailure;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "vidgrab-updater: self-update tool for VidGrab\n"
        "\n"
        "Usage:\n"
        "  vidgrab-updater check                    Check for a newer release\n"
        "  vidgrab-updater download                 Download the update for this platform\n"
        "  vidgrab-updater install                  Download and install the update\n"
        "  vidgrab-updater changelog <file> [--all] Parse release notes from a file\n"
        "  vidgrab-updater version                  Show version\n"
        "  vidgrab-updater help                     Show this help\n"
        "\n"
        "Environment:\n"
        "  GITHUB_TOKEN, GITHUB_TOKEN_FALLBACK      Registry credentials, tried in order\n"
        "\n"
        "Configuration: " << Config::config_path() << "\n"
        "Press Ctrl+C during a download to cancel it.\n";
    return kExitOk;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "vidgrab-updater " << Updater::current_version() << "\n";
    return kExitOk;
}

// ── Wiring ──────────────────────────────────────────────────

UpdaterOptions CLI::updater_options(const Config& config) {
    const auto& d = config.data();

    UpdaterOptions options;
    options.fetch.api_base = d.api_base;
    options.fetch.repo = d.repo;
    options.fetch.user_agent = d.user_agent;
    options.fetch.tokens = d.tokens;
    options.fetch.timeout = std::chrono::seconds(d.registry_timeout_sec);

    options.transfer.download_dir = config.downloads_dir();
    options.transfer.user_agent = d.user_agent;
    options.transfer.timeout = std::chrono::seconds(d.download_timeout_sec);
    options.transfer.max_redirects = d.max_redirects;

    options.quit_grace = std::chrono::milliseconds(d.quit_grace_ms);
    return options;
}

void CLI::print_update(const UpdateInfo& info) {
    std::cout << "Current:   " << info.current_version << "\n";
    std::cout << "Latest:    " << info.version;
    if (!info.release_date.empty()) std::cout << " (" << info.release_date << ")";
    std::cout << "\n";
    std::cout << "Mandatory: " << (info.mandatory ? "yes" : "no") << "\n";
    std::cout << "Asset:     " << info.download_url << "\n";
}

int CLI::report_failure(const Updater& updater, const char* what) {
    auto status = updater.get_status();
    if (status.state == UpdateState::Cancelled) {
        std::cerr << what << " cancelled.\n";
        return kExitCancelled;
    }
    std::cerr << what << " failed";
    if (!status.error.empty()) {
        std::cerr << ": " << status.error << " [" << error_kind_name(status.error_kind) << "]";
    }
    std::cerr << "\n";
    return kExitFailure;
}

// ── check ───────────────────────────────────────────────────

int CLI::cmd_check() {
    Config config;
    config.load();
    config.load_env_tokens();

    HttplibClient http;
    SystemDesktop desktop;
    Updater updater(http, desktop, updater_options(config));

    auto info = updater.check_for_updates();
    if (info) {
        std::cout << "Update available\n";
        print_update(*info);
        return kExitOk;
    }

    auto status = updater.get_status();
    if (status.state == UpdateState::NotAvailable) {
        std::cout << "vidgrab-updater " << updater.options().current_version << " (up to date)\n";
        return kExitOk;
    }
    return report_failure(updater, "Update check");
}

// ── download / install ──────────────────────────────────────

int CLI::cmd_download(bool then_install) {
    Config config;
    config.load();
    config.load_env_tokens();

    // The quit request lands on a timer thread; main unwinds normally instead
    auto quit = std::make_shared<std::promise<void>>();
    std::future<void> quit_requested = quit->get_future();

    HttplibClient http;
    SystemDesktop desktop([quit] { quit->set_value(); });
    Updater updater(http, desktop, updater_options(config));

    auto info = updater.check_for_updates();
    if (!info) {
        if (updater.get_status().state == UpdateState::NotAvailable) {
            std::cout << "Already up to date (" << updater.options().current_version << ").\n";
            return kExitOk;
        }
        return report_failure(updater, "Update check");
    }
    print_update(*info);

    ProgressView view;
    std::string linux_notice;
    int listener = updater.add_listener([&](const UpdateEvent& event) {
        switch (event.type) {
            case UpdateEventType::Progress:
                if (event.progress) view.update(*event.progress);
                break;
            case UpdateEventType::LinuxDeb:
                linux_notice = "Install the package with:\n  " + Installer::deb_install_command(event.path);
                break;
            case UpdateEventType::LinuxAppImage:
                linux_notice = "Replace the running AppImage with:\n  " + event.path;
                break;
            default:
                break;
        }
    });

    std::optional<std::string> path;
    {
        InterruptGuard guard(updater);
        path = updater.download_update();
    }
    view.finish();

    if (!path) {
        updater.remove_listener(listener);
        return report_failure(updater, "Download");
    }
    std::cout << "Downloaded to " << *path << "\n";

    if (!then_install) {
        updater.remove_listener(listener);
        return kExitOk;
    }

    bool ok = updater.install_update();
    updater.remove_listener(listener);
    if (!ok) {
        return report_failure(updater, "Install");
    }
    if (!linux_notice.empty()) {
        std::cout << linux_notice << "\n";
    } else {
        std::cout << "Installer launched; exiting.\n";
        quit_requested.wait();
    }
    return kExitOk;
}

// ── changelog ───────────────────────────────────────────────

int CLI::cmd_changelog(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: vidgrab-updater changelog <file> [--all]\n";
        return kExitFailure;
    }

    std::ifstream fin(argv[2]);
    if (!fin.is_open()) {
        std::cerr << "Cannot open " << argv[2] << "\n";
        return kExitFailure;
    }
    std::stringstream buf;
    buf << fin.rdbuf();
    std::string body = buf.str();

    bool all = argc >= 4 && std::strcmp(argv[3], "--all") == 0;
    if (!all) {
        print_sections(parse_changelog_sections(body));
        return kExitOk;
    }

    auto entries = parse_multi_version(body);
    if (entries.empty()) {
        std::cout << "No versioned entries found.\n";
        return kExitOk;
    }
    for (size_t i = 0; i < entries.size(); i++) {
        if (i > 0) std::cout << "\n";
        std::cout << "[" << entries[i].version << "]";
        if (!entries[i].date.empty()) std::cout << " - " << entries[i].date;
        std::cout << "\n";
        print_sections(entries[i].sections);
    }
    return kExitOk;
}
