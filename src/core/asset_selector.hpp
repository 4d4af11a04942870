#pragma once

#include "core/update_types.hpp"

#include <optional>
#include <string>
#include <vector>

/// Detect the running OS and architecture (normalized names)
PlatformInfo detect_platform();

/// Build a PlatformInfo from loose names ("win32"/"x64", "darwin"/"arm64", ...)
PlatformInfo make_platform(const std::string& os, const std::string& arch);

std::string normalize_os(const std::string& os);
std::string normalize_arch(const std::string& arch);

/// Pick the installable artifact for the platform.
/// Strict per-OS rules first, then a coarse platform keyword match.
/// Returns nullopt if nothing matches either pass.
std::optional<AssetInfo> select_asset(const std::vector<AssetInfo>& assets,
                                      const PlatformInfo& platform);

std::optional<std::string> select_asset_url(const std::vector<AssetInfo>& assets,
                                            const std::string& os,
                                            const std::string& arch);
