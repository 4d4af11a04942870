#pragma once

#include "core/config.hpp"
#include "core/updater.hpp"

#include <string>

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns the process exit code: 0 success, 1 failure, 2 cancelled.
    static int run(int argc, char* argv[]);

    static constexpr int kExitOk = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitCancelled = 2;

    /// Map the loaded configuration onto coordinator options
    static UpdaterOptions updater_options(const Config& config);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_check();
    static int cmd_download(bool then_install);
    static int cmd_changelog(int argc, char* argv[]);

    static void print_update(const UpdateInfo& info);
    static int report_failure(const Updater& updater, const char* what);
};
