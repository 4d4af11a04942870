#pragma once

#include "core/update_types.hpp"
#include "platform/desktop.hpp"

#include <chrono>
#include <string>

enum class InstallOutcome {
    None,
    LaunchedInstaller,  // Windows/macOS: handler opened, app quitting
    LinuxDeb,           // revealed; user runs dpkg manually
    LinuxAppImage       // revealed; nothing else to do
};

struct InstallResult {
    bool success = false;
    InstallOutcome outcome = InstallOutcome::None;
    UpdateError error;
};

// ── Installer class ────────────────────────────────────────────

class Installer {
public:
    Installer(Desktop& desktop,
              PlatformInfo platform,
              std::chrono::milliseconds quit_grace = std::chrono::milliseconds(1000));

    /// Run the platform install action for a downloaded artifact
    InstallResult install(const std::string& artifact_path) const;

    /// True for ".deb" artifacts (case-insensitive)
    static bool is_deb_package(const std::string& path);

    /// Command a user runs to install a .deb package
    static std::string deb_install_command(const std::string& path);

private:
    Desktop& desktop_;
    PlatformInfo platform_;
    std::chrono::milliseconds quit_grace_;
};
