#include "config.h"
#include "logger.h"
#include <cstdlib>
#include <fstream>

namespace config {

static std::string stringOr(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::string();
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

bool Config::load(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        logger::debug("Config file not found: " + configPath);
        return false;
    }

    try {
        nlohmann::json loaded;
        file >> loaded;
        if (!loaded.is_object()) {
            logger::error("Config root must be an object: " + configPath);
            return false;
        }
        for (auto it = loaded.begin(); it != loaded.end(); ++it) {
            data[it.key()] = it.value();
        }
        logger::debug("Loaded config from: " + configPath);
        return true;
    } catch (const nlohmann::json::exception& e) {
        logger::error("Failed to load config " + configPath + ": " + e.what());
        return false;
    }
}

void Config::setString(const char* key, const char* envName) {
    const char* value = std::getenv(envName);
    if (value != nullptr && *value != '\0') {
        data[key] = std::string(value);
    }
}

void Config::loadFromEnvironment() {
    setString("bin", ENV_BIN);
    setString("bin_dir", ENV_BIN_DIR);
    setString("embedded_bin", ENV_EMBEDDED_BIN);
    setString("log_file", ENV_LOG_FILE);

    const char* debug = std::getenv(ENV_DEBUG);
    if (debug != nullptr && *debug != '\0') {
        data["debug"] = std::string(debug) == "1";
    }
}

Settings Config::getSettings() const {
    Settings settings;
    settings.binPath = stringOr(data, "bin");
    settings.binDir = stringOr(data, "bin_dir");
    settings.embeddedBin = stringOr(data, "embedded_bin");
    settings.logFile = stringOr(data, "log_file");
    if (data.contains("debug") && data["debug"].is_boolean()) {
        settings.debug = data["debug"].get<bool>();
    }
    return settings;
}

void Config::setSettings(const Settings& settings) {
    data["bin"] = settings.binPath;
    data["bin_dir"] = settings.binDir;
    data["embedded_bin"] = settings.embeddedBin;
    data["log_file"] = settings.logFile;
    data["debug"] = settings.debug;
}

void Config::reset() {
    data = nlohmann::json::object();
}

// Global convenience functions
bool loadConfig(const std::string& configPath) {
    return Config::getInstance().load(configPath);
}

void loadEnvironment() {
    Config::getInstance().loadFromEnvironment();
}

Settings getSettings() {
    return Config::getInstance().getSettings();
}

void setSettings(const Settings& settings) {
    Config::getInstance().setSettings(settings);
}

}
