#pragma once

#include <string>
#include <vector>

struct AppConfig {
    // Release registry
    std::string api_base = "https://api.github.com";
    std::string repo = "nazeefmasood/youtube-downloader-gui";
    std::string user_agent = "VidGrab-Updater";
    int registry_timeout_sec = 30;

    // Download
    std::string download_dir;  // empty = platform downloads directory
    int download_timeout_sec = 300;
    int max_redirects = 10;

    // Install
    int quit_grace_ms = 1000;

    // Logging
    std::string log_level = "info";
    std::string log_file;  // empty = stderr only

    // Never persisted; filled from the environment
    std::vector<std::string> tokens;
};

class Config {
public:
    Config();
    ~Config();

    bool load();
    bool save();

    /// Append GITHUB_TOKEN then GITHUB_TOKEN_FALLBACK when set and non-empty
    void load_env_tokens();

    AppConfig& data();
    const AppConfig& data() const;

    /// Configured download directory, or the platform default when unset
    std::string downloads_dir() const;

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();
    static std::string expand_home(const std::string& path);

private:
    AppConfig config_;
};
