#include "core/config.hpp"
#include "platform/desktop.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() = default;

Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    if (is_privileged()) {
        return "/etc/vidgrab-updater";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/vidgrab-updater";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

std::string Config::downloads_dir() const {
    if (!config_.download_dir.empty()) {
        return expand_home(config_.download_dir);
    }
    return SystemDesktop::downloads_dir();
}

void Config::load_env_tokens() {
    for (const char* name : {"GITHUB_TOKEN", "GITHUB_TOKEN_FALLBACK"}) {
        const char* value = std::getenv(name);
        if (value && *value) {
            config_.tokens.emplace_back(value);
        }
    }
}

bool Config::load() {
    std::string path = config_path();
    if (path.empty() || !fs::exists(path)) {
        return false;
    }

    // Parse into a copy so a malformed file leaves the defaults intact
    AppConfig loaded = config_;
    try {
        YAML::Node root = YAML::LoadFile(path);

        // Registry section
        if (auto registry = root["registry"]) {
            loaded.api_base = registry["api_base"].as<std::string>(loaded.api_base);
            loaded.repo = registry["repo"].as<std::string>(loaded.repo);
            loaded.user_agent = registry["user_agent"].as<std::string>(loaded.user_agent);
            loaded.registry_timeout_sec = registry["timeout_sec"].as<int>(loaded.registry_timeout_sec);
        }

        // Download section
        if (auto download = root["download"]) {
            loaded.download_dir = download["directory"].as<std::string>(loaded.download_dir);
            loaded.download_timeout_sec = download["timeout_sec"].as<int>(loaded.download_timeout_sec);
            loaded.max_redirects = download["max_redirects"].as<int>(loaded.max_redirects);
        }

        // Install section
        if (auto install = root["install"]) {
            loaded.quit_grace_ms = install["quit_grace_ms"].as<int>(loaded.quit_grace_ms);
        }

        // Log section
        if (auto log = root["log"]) {
            loaded.log_level = log["level"].as<std::string>(loaded.log_level);
            loaded.log_file = log["file"].as<std::string>(loaded.log_file);
        }
    } catch (const YAML::Exception& e) {
        spdlog::warn("[Config] Ignoring {}: {}", path, e.what());
        return false;
    }

    config_ = std::move(loaded);
    return true;
}

bool Config::save() {
    std::string dir = config_dir();
    std::string path = config_path();
    if (dir.empty() || path.empty()) return false;

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        spdlog::error("[Config] Cannot create {}: {}", dir, ec.message());
        return false;
    }

    YAML::Emitter out;
    out << YAML::BeginMap;

    // Registry section
    out << YAML::Key << "registry" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "api_base" << YAML::Value << config_.api_base;
    out << YAML::Key << "repo" << YAML::Value << config_.repo;
    out << YAML::Key << "user_agent" << YAML::Value << config_.user_agent;
    out << YAML::Key << "timeout_sec" << YAML::Value << config_.registry_timeout_sec;
    out << YAML::EndMap;

    // Download section
    out << YAML::Key << "download" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "directory" << YAML::Value << config_.download_dir;
    out << YAML::Key << "timeout_sec" << YAML::Value << config_.download_timeout_sec;
    out << YAML::Key << "max_redirects" << YAML::Value << config_.max_redirects;
    out << YAML::EndMap;

    // Install section
    out << YAML::Key << "install" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "quit_grace_ms" << YAML::Value << config_.quit_grace_ms;
    out << YAML::EndMap;

    // Log section
    out << YAML::Key << "log" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "level" << YAML::Value << config_.log_level;
    out << YAML::Key << "file" << YAML::Value << config_.log_file;
    out << YAML::EndMap;

    out << YAML::EndMap;

    std::ofstream fout(path);
    if (!fout.is_open()) return false;
    fout << out.c_str();
    return static_cast<bool>(fout);
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
