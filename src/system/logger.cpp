#include "logger.h"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cstring>
#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#include <io.h>
// Undefine Windows macros that conflict with our enum
#undef ERROR
#else
#include <unistd.h>
#endif

namespace logger {

Logger& Logger::getInstance() {
    static Logger instance;
    static bool initialized = false;

    if (!initialized) {
        instance.colorsEnabled = Logger::detectColorSupport();
        initialized = true;
    }

    return instance;
}

void Logger::setLevel(Level level) {
    std::lock_guard<std::mutex> lock(mutex);
    currentLevel = level;
}

Level Logger::getLevel() const {
    std::lock_guard<std::mutex> lock(mutex);
    return currentLevel;
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex);
    if (filename.empty()) {
        logFile.reset();
        return;
    }
    logFile = std::make_unique<std::ofstream>(filename, std::ios::app);
    if (!logFile->is_open()) {
        std::cerr << "Warning: Could not open log file: " << filename << std::endl;
        logFile.reset();
    }
}

void Logger::enableConsoleOutput(bool enable) {
    consoleOutput = enable;
}

void Logger::enableColors(bool enable) {
    colorsEnabled = enable;
}

bool Logger::isColorsEnabled() const {
    return colorsEnabled;
}

void Logger::debug(const std::string& message) {
    log(Level::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(Level::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(Level::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(Level::ERROR, message);
}

void Logger::fatal(const std::string& message) {
    log(Level::FATAL, message);
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex);
    if (level < currentLevel) {
        return;
    }

    std::string line = "[" + getCurrentTimestamp() + "] [" + levelToString(level) + "] " + message;

    if (consoleOutput) {
        if (colorsEnabled) {
            std::cerr << getColorCode(level) << line << getResetCode() << std::endl;
        } else {
            std::cerr << line << std::endl;
        }
    }

    if (logFile && logFile->is_open()) {
        *logFile << line << std::endl;
    }
}

std::string Logger::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

std::string Logger::levelToString(Level level) {
    switch (level) {
        case Level::DEBUG:   return "DEBUG";
        case Level::INFO:    return "INFO ";
        case Level::WARNING: return "WARN ";
        case Level::ERROR:   return "ERROR";
        case Level::FATAL:   return "FATAL";
        default:             return "UNKNOWN";
    }
}

std::string Logger::getColorCode(Level level) {
    switch (level) {
        case Level::DEBUG:   return "\033[36m";  // Cyan
        case Level::INFO:    return "\033[32m";  // Green
        case Level::WARNING: return "\033[33m";  // Yellow
        case Level::ERROR:   return "\033[31m";  // Red
        case Level::FATAL:   return "\033[35m";  // Magenta
        default:             return "\033[0m";
    }
}

std::string Logger::getResetCode() {
    return "\033[0m";
}

bool Logger::detectColorSupport() {
#ifdef _WIN32
    HANDLE hErr = GetStdHandle(STD_ERROR_HANDLE);
    if (hErr == INVALID_HANDLE_VALUE) {
        return false;
    }
    DWORD dwMode = 0;
    if (!GetConsoleMode(hErr, &dwMode)) {
        return false;
    }
    dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    return SetConsoleMode(hErr, dwMode) != 0;
#else
    // Logs go to stderr, so that is the stream that has to be a terminal
    if (!isatty(STDERR_FILENO)) {
        return false;
    }
    if (std::getenv("NO_COLOR") != nullptr) {
        return false;
    }
    const char* term = std::getenv("TERM");
    if (!term || std::strcmp(term, "dumb") == 0) {
        return false;
    }
    return (std::strstr(term, "color") != nullptr ||
            std::strstr(term, "xterm") != nullptr ||
            std::strstr(term, "screen") != nullptr ||
            std::strstr(term, "tmux") != nullptr);
#endif
}

void setLevel(Level level) {
    Logger::getInstance().setLevel(level);
}

void setLogFile(const std::string& filename) {
    Logger::getInstance().setLogFile(filename);
}

void enableConsoleOutput(bool enable) {
    Logger::getInstance().enableConsoleOutput(enable);
}

void enableColors(bool enable) {
    Logger::getInstance().enableColors(enable);
}

bool isDebugEnabled() {
    return Logger::getInstance().getLevel() <= Level::DEBUG;
}

void debug(const std::string& message) {
    Logger::getInstance().debug(message);
}

void info(const std::string& message) {
    Logger::getInstance().info(message);
}

void warning(const std::string& message) {
    Logger::getInstance().warning(message);
}

void error(const std::string& message) {
    Logger::getInstance().error(message);
}

void fatal(const std::string& message) {
    Logger::getInstance().fatal(message);
}

}
