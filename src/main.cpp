#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/log.hpp"

int main(int argc, char* argv[]) {
    Config config;
    config.load();
    init_logging(config.data().log_level, config.data().log_file);

    return CLI::run(argc, argv);
}
