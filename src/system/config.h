#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include <nlohmann/json.hpp>

namespace config {

    // Environment variable names recognized as overrides
    constexpr const char* ENV_BIN = "CONVERT_7Z_BIN";
    constexpr const char* ENV_BIN_DIR = "CONVERT_7Z_BIN_DIR";
    constexpr const char* ENV_DEBUG = "CONVERT_7Z_ZIP_DEBUG";
    constexpr const char* ENV_EMBEDDED_BIN = "CONVERT_7Z_EMBEDDED_BIN";
    constexpr const char* ENV_LOG_FILE = "CONVERT_7Z_LOG_FILE";

    struct Settings {
        std::string binPath;      // explicit archive tool, highest priority
        std::string binDir;       // searched before the conventional directories
        std::string embeddedBin;  // last-resort fallback, empty = built-in default
        std::string logFile;
        bool debug = false;
    };

    class Config {
    public:
        static Config& getInstance();

        // Merges config.json values. A missing file is not an error.
        bool load(const std::string& configPath);

        // Applies environment overrides on top of whatever is loaded.
        void loadFromEnvironment();

        Settings getSettings() const;
        void setSettings(const Settings& settings);

        // Drops everything loaded so far
        void reset();

    private:
        Config() = default;
        ~Config() = default;
        Config(const Config&) = delete;
        Config& operator=(const Config&) = delete;

        void setString(const char* key, const char* envName);

        nlohmann::json data = nlohmann::json::object();
    };

    // Global convenience functions
    bool loadConfig(const std::string& configPath);
    void loadEnvironment();
    Settings getSettings();
    void setSettings(const Settings& settings);
}

#endif // CONFIG_H
