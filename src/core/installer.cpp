#include "core/installer.hpp"
#include "core/asset_selector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

// ════════════════════════════════════════════════════════════════
// Private helpers
// ════════════════════════════════════════════════════════════════

/// Shell-escape a string by wrapping in single quotes and escaping embedded quotes
static std::string shell_quote(const std::string& s) {
    std::string result = "'";
    for (char c : s) {
        if (c == '\'') {
            result += "'\\''";
        } else {
            result += c;
        }
    }
    result += "'";
    return result;
}

static InstallResult install_failure(const std::string& message) {
    InstallResult result;
    result.error = {UpdateErrorKind::Io, 0, message};
    spdlog::error("[Installer] {}", message);
    return result;
}

// ════════════════════════════════════════════════════════════════
// Installer
// ════════════════════════════════════════════════════════════════

Installer::Installer(Desktop& desktop, PlatformInfo platform, std::chrono::milliseconds quit_grace)
    : desktop_(desktop),
      platform_(make_platform(platform.os, platform.arch)),
      quit_grace_(quit_grace) {}

bool Installer::is_deb_package(const std::string& path) {
    if (path.size() < 4) return false;
    std::string ext = path.substr(path.size() - 4);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".deb";
}

std::string Installer::deb_install_command(const std::string& path) {
    return "sudo dpkg -i " + shell_quote(path);
}

InstallResult Installer::install(const std::string& artifact_path) const {
    if (artifact_path.empty()) {
        return install_failure("No update downloaded");
    }

    std::error_code ec;
    if (!fs::is_regular_file(artifact_path, ec)) {
        return install_failure("Downloaded update not found: " + artifact_path);
    }

    InstallResult result;
    std::string error;

    if (platform_.os == "windows" || platform_.os == "darwin") {
        if (!desktop_.open_path(artifact_path, error)) {
            return install_failure("Failed to open installer: " + error);
        }
        // Let the handler come up before this process goes away
        desktop_.request_quit(quit_grace_);
        result.outcome = InstallOutcome::LaunchedInstaller;
        result.success = true;
        spdlog::info("[Installer] Launched {}", artifact_path);
        return result;
    }

    if (platform_.os == "linux") {
        if (!desktop_.show_item_in_folder(artifact_path, error)) {
            return install_failure("Failed to reveal update: " + error);
        }
        if (is_deb_package(artifact_path)) {
            result.outcome = InstallOutcome::LinuxDeb;
            spdlog::info("[Installer] Manual install required: {}", deb_install_command(artifact_path));
        } else {
            // AppImages are self-contained, nothing to install
            result.outcome = InstallOutcome::LinuxAppImage;
        }
        result.success = true;
        return result;
    }

    return install_failure("Unsupported platform: " + platform_.os);
}
