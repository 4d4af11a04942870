#pragma once

#include <string>

/// Install the default spdlog logger: coloured stderr, plus a rotating file
/// (5 MiB, one backup) when `file` is non-empty. Unknown levels fall back to info.
void init_logging(const std::string& level, const std::string& file = "");
