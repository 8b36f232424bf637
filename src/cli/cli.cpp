#include "cli.h"
#include "../core/converter.h"
#include "../system/config.h"
#include "../system/environment.h"
#include "../system/fs.h"
#include "../system/logger.h"
#include "../utils/process.h"
#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#ifndef SZ2ZIP_VERSION
#define SZ2ZIP_VERSION "0.0.0"
#endif

namespace cli {

static std::string defaultConfigPath() {
    std::string exeDir = fs::getExecutablePath();
    if (exeDir.empty()) {
        return "config.json";
    }
    return (std::filesystem::path(exeDir) / "config.json").string();
}

static void applyLogging(const config::Settings& settings, bool verbose) {
    logger::setLevel(verbose || settings.debug ? logger::Level::DEBUG : logger::Level::INFO);
    if (!settings.logFile.empty()) {
        logger::setLogFile(settings.logFile);
    }
}

int runCommand(int argc, char** argv) {
    argparse::ArgumentParser program("sz2zip", SZ2ZIP_VERSION);
    program.add_description("Convert a .7z archive into an equivalent .zip using an external 7-Zip binary");
    program.add_epilog(
        "Environment overrides:\n"
        "  CONVERT_7Z_BIN           full path of the 7z binary to use\n"
        "  CONVERT_7Z_BIN_DIR       directory searched first for 7zz/7z/7za\n"
        "  CONVERT_7Z_EMBEDDED_BIN  last-resort 7za\n"
        "  CONVERT_7Z_LOG_FILE      append log lines to this file\n"
        "  CONVERT_7Z_ZIP_DEBUG=1   verbose logging\n");

    program.add_argument("input")
        .help("path to the .7z archive");

    program.add_argument("output")
        .help("output .zip path (default: input with .zip extension)")
        .nargs(argparse::nargs_pattern::optional)
        .default_value(std::string(""));

    program.add_argument("--config")
        .help("JSON config file (default: config.json next to the executable)")
        .default_value(std::string(""));

    program.add_argument("--bin")
        .help("7z binary to use, overrides CONVERT_7Z_BIN")
        .default_value(std::string(""));

    program.add_argument("--verbose")
        .help("enable verbose (debug) logging")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--report")
        .help("print a JSON conversion report instead of the bare output path")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        logger::error(e.what());
        std::cerr << program;
        return EXIT_USAGE;
    }

    std::string configPath = program.get<std::string>("--config");
    if (configPath.empty()) {
        configPath = defaultConfigPath();
    } else if (!std::filesystem::exists(configPath)) {
        logger::warning("Config file not found: " + configPath);
    }
    config::loadConfig(configPath);
    config::loadEnvironment();
    config::Settings settings = config::getSettings();
    if (!program.get<std::string>("--bin").empty()) {
        settings.binPath = program.get<std::string>("--bin");
        config::setSettings(settings);
    }
    applyLogging(settings, program.get<bool>("--verbose"));
    logger::debug("Verbose mode enabled");

    const std::string input = program.get<std::string>("input");
    std::optional<std::string> output;
    if (!program.get<std::string>("output").empty()) {
        output = program.get<std::string>("output");
    }

    try {
        utils::ShellProcessRunner runner;
        core::Converter converter(runner, env::Environment::detect(), core::resolverOptionsFromConfig());
        core::ConversionResult result = converter.convert(core::ConversionRequest{input, output});

        if (program.get<bool>("--report")) {
            nlohmann::json report = result;
            std::cout << report.dump(2) << std::endl;
        } else {
            std::cout << result.outputPath << std::endl;
        }
        logger::info("converted -> " + result.outputPath);
        return EXIT_OK;
    } catch (const std::exception& e) {
        // ConversionError subclasses, plus launch failures of the resolved tool
        logger::error(std::string("conversion failed: ") + e.what());
        return EXIT_CONVERSION_FAILED;
    }
}

}
