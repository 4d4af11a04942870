#include "platform/desktop.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <thread>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#include <shellapi.h>
#else
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

SystemDesktop::SystemDesktop(std::function<void()> on_quit)
    : on_quit_(std::move(on_quit)) {}

#ifndef _WIN32
/// fork + execvp the opener and wait for it; openers hand off to the
/// desktop environment and return promptly.
static bool run_opener(const std::vector<std::string>& args, std::string& error) {
    std::vector<const char*> argv;
    for (const auto& a : args) {
        argv.push_back(a.c_str());
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    int status = 0;
    if (waitpid(pid, &status, 0) < 0) {
        error = std::string("waitpid failed: ") + std::strerror(errno);
        return false;
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        error = args[0] + (code == 127 ? " not found" : " exited with code " + std::to_string(code));
        return false;
    }
    return true;
}
#endif

bool SystemDesktop::open_path(const std::string& path, std::string& error) {
    spdlog::info("[Desktop] Opening {}", path);
#if defined(_WIN32)
    auto rc = reinterpret_cast<INT_PTR>(
        ShellExecuteA(nullptr, "open", path.c_str(), nullptr, nullptr, SW_SHOWNORMAL));
    if (rc <= 32) {
        error = "ShellExecute failed with code " + std::to_string(rc);
        return false;
    }
    return true;
#elif defined(__APPLE__)
    return run_opener({"open", path}, error);
#else
    return run_opener({"xdg-open", path}, error);
#endif
}

bool SystemDesktop::show_item_in_folder(const std::string& path, std::string& error) {
    spdlog::info("[Desktop] Revealing {}", path);
#if defined(_WIN32)
    std::string args = "/select,\"" + path + "\"";
    auto rc = reinterpret_cast<INT_PTR>(
        ShellExecuteA(nullptr, "open", "explorer.exe", args.c_str(), nullptr, SW_SHOWNORMAL));
    if (rc <= 32) {
        error = "ShellExecute failed with code " + std::to_string(rc);
        return false;
    }
    return true;
#elif defined(__APPLE__)
    return run_opener({"open", "-R", path}, error);
#else
    // xdg-open has no "select"; open the containing directory instead
    std::string dir = fs::path(path).parent_path().string();
    if (dir.empty()) dir = ".";
    return run_opener({"xdg-open", dir}, error);
#endif
}

void SystemDesktop::request_quit(std::chrono::milliseconds grace) {
    spdlog::info("[Desktop] Quitting in {} ms", grace.count());
    auto on_quit = on_quit_;
    std::thread([grace, on_quit] {
        std::this_thread::sleep_for(grace);
        if (on_quit) {
            on_quit();
        } else {
            // Static destructors may still be in use on the main thread
            spdlog::shutdown();
            std::fflush(nullptr);
            std::_Exit(0);
        }
    }).detach();
}

std::string SystemDesktop::downloads_dir() {
#ifdef _WIN32
    const char* profile = std::getenv("USERPROFILE");
    if (profile) {
        return (fs::path(profile) / "Downloads").string();
    }
    return fs::temp_directory_path().string();
#else
    if (const char* xdg = std::getenv("XDG_DOWNLOAD_DIR")) {
        if (*xdg) return xdg;
    }
    if (const char* home = std::getenv("HOME")) {
        return (fs::path(home) / "Downloads").string();
    }
    return fs::temp_directory_path().string();
#endif
}
