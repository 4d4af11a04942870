#include "core/asset_selector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

#ifndef _WIN32
#include <sys/utsname.h>
#endif

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

std::string normalize_os(const std::string& os) {
    std::string o = to_lower(os);
    if (o == "win32" || o == "windows" || o == "win" || o == "win64") return "windows";
    if (o == "darwin" || o == "macos" || o == "mac" || o == "osx") return "darwin";
    return o;
}

std::string normalize_arch(const std::string& arch) {
    std::string a = to_lower(arch);
    if (a == "x64" || a == "x86_64" || a == "amd64") return "amd64";
    if (a == "arm64" || a == "aarch64") return "arm64";
    if (a == "ia32" || a == "i386" || a == "i686" || a == "x86") return "386";
    if (a == "armv7l" || a == "armv7" || a == "arm") return "armv7";
    return a;
}

PlatformInfo make_platform(const std::string& os, const std::string& arch) {
    return PlatformInfo{normalize_os(os), normalize_arch(arch)};
}

PlatformInfo detect_platform() {
    PlatformInfo info;

#if defined(_WIN32)
    info.os = "windows";
#elif defined(__APPLE__)
    info.os = "darwin";
#elif defined(__linux__)
    info.os = "linux";
#else
    info.os = "unknown";
#endif

#if defined(_WIN32)
#if defined(_M_ARM64)
    info.arch = "arm64";
#elif defined(_M_X64)
    info.arch = "amd64";
#else
    info.arch = "386";
#endif
#else
    struct utsname uts;
    if (uname(&uts) == 0) {
        info.arch = normalize_arch(uts.machine);
    } else {
        info.arch = "amd64";
    }
#endif

    return info;
}

/// Tokens an asset name may use for the given normalized arch
static std::vector<std::string> arch_tokens(const std::string& arch) {
    if (arch == "amd64") return {"amd64", "x86_64"};
    if (arch == "arm64") return {"arm64", "aarch64"};
    if (arch == "armv7") return {"armv7l", "armv7"};
    if (arch == "386") return {"i386", "ia32"};
    return {arch};
}

static bool matches_strict(const std::string& name, const PlatformInfo& platform) {
    if (platform.os == "windows") {
        return ends_with(name, ".exe") && !contains(name, "portable");
    }
    if (platform.os == "darwin") {
        return ends_with(name, ".zip") || ends_with(name, ".dmg");
    }
    if (platform.os == "linux") {
        auto tokens = arch_tokens(platform.arch);
        bool has_arch = std::any_of(tokens.begin(), tokens.end(),
                                    [&](const std::string& t) { return contains(name, t); });
        return has_arch && (contains(name, ".appimage") || ends_with(name, ".deb"));
    }
    return false;
}

static std::string platform_keyword(const std::string& os) {
    if (os == "windows") return "win";
    if (os == "darwin") return "mac";
    if (os == "linux") return "linux";
    return "";
}

std::optional<AssetInfo> select_asset(const std::vector<AssetInfo>& assets,
                                      const PlatformInfo& platform) {
    PlatformInfo p = make_platform(platform.os, platform.arch);

    for (const auto& asset : assets) {
        if (matches_strict(to_lower(asset.name), p)) {
            spdlog::debug("[AssetSelector] Selected {} for {}-{}", asset.name, p.os, p.arch);
            return asset;
        }
    }

    std::string keyword = platform_keyword(p.os);
    if (!keyword.empty()) {
        for (const auto& asset : assets) {
            if (contains(to_lower(asset.name), keyword)) {
                spdlog::debug("[AssetSelector] Loose match {} for {}", asset.name, p.os);
                return asset;
            }
        }
    }

    spdlog::warn("[AssetSelector] No asset matches {}-{} among {} assets",
                 p.os, p.arch, assets.size());
    return std::nullopt;
}

std::optional<std::string> select_asset_url(const std::vector<AssetInfo>& assets,
                                            const std::string& os,
                                            const std::string& arch) {
    auto asset = select_asset(assets, make_platform(os, arch));
    if (!asset) return std::nullopt;
    return asset->download_url;
}
