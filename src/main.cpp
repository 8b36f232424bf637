#include <string>
#include "system/logger.h"
#include "cli/cli.h"

int main(int argc, char** argv) {
    // Default to INFO; raised to DEBUG by --verbose or the debug setting
    logger::setLevel(logger::Level::INFO);
    // Early lightweight scan for --verbose to enable debug before any logs
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--verbose") {
            logger::setLevel(logger::Level::DEBUG);
            break;
        }
    }
    logger::debug("Color support: " + std::string(logger::Logger::getInstance().isColorsEnabled() ? "enabled" : "disabled"));

    return cli::runCommand(argc, argv);
}
