#pragma once

#include <string>

/// Compare dotted version strings such as "v1.10.2" and "1.9".
/// Returns -1, 0 or 1. Missing segments count as 0, and so do segments that
/// are not plain digits, so a malformed remote tag never throws.
int compare_versions(const std::string& a, const std::string& b);

/// True when `candidate` is strictly newer than `current`
bool is_newer_version(const std::string& current, const std::string& candidate);

/// "v1.2.3" -> "1.2.3"
std::string strip_version_prefix(const std::string& tag);
