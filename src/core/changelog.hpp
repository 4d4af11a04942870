#pragma once

#include "core/update_types.hpp"

#include <string>
#include <vector>

/// Extract Added/Changed/Fixed/Removed bullet lists from free-text release
/// notes. Best effort: unrecognized input yields empty sections.
ChangelogSection parse_changelog_sections(const std::string& body);

/// Split a multi-version document on "## [X.Y.Z] - YYYY-MM-DD" headers and
/// parse each block. Blocks without any bullet are dropped.
std::vector<ChangelogEntry> parse_multi_version(const std::string& body);

/// Current UTC time as ISO-8601 ("2025-01-31T12:00:00Z")
std::string iso8601_now();
