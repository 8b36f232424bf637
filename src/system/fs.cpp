#include "fs.h"
#include "logger.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>
#include <cerrno>
#include <cstring>

#ifdef _WIN32
#include <windows.h>
#include <random>
#else
#include <unistd.h>
#include <limits.h>
#include <stdlib.h>
#endif

namespace fs {

std::string getExecutablePath() {
#ifdef _WIN32
    char path[MAX_PATH];
    GetModuleFileNameA(NULL, path, MAX_PATH);
    std::filesystem::path exePath(path);
    return exePath.parent_path().string();
#else
    char path[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", path, sizeof(path) - 1);
    if (len != -1) {
        path[len] = '\0';
        std::filesystem::path exePath(path);
        return exePath.parent_path().string();
    }
    return "";
#endif
}

bool createDirectoryIfNotExists(const std::string& path) {
    if (path.empty()) {
        return true;
    }
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return true;
    }
    std::filesystem::create_directories(path, ec);
    if (ec) {
        logger::error("Failed to create directory " + path + ": " + ec.message());
        return false;
    }
    logger::debug("Created directory: " + path);
    return true;
}

bool writeFile(const std::string& filePath, const std::string& content) {
    std::ofstream file(filePath, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        logger::error("Failed to create file: " + filePath);
        return false;
    }
    file << content;
    file.close();
    return !file.fail();
}

void ensureExecutable(const std::string& filePath) {
    namespace stdfs = std::filesystem;
    std::error_code ec;
    stdfs::permissions(filePath,
                       stdfs::perms::owner_all |
                       stdfs::perms::group_read | stdfs::perms::group_exec |
                       stdfs::perms::others_read | stdfs::perms::others_exec,
                       stdfs::perm_options::replace, ec);
    if (ec) {
        logger::debug("chmod 755 failed for " + filePath + ": " + ec.message());
    }
}

bool replaceFile(const std::string& source, const std::string& target) {
    std::error_code ec;
    std::filesystem::rename(source, target, ec);
    if (!ec) {
        return true;
    }
    logger::debug("rename " + source + " -> " + target + " failed (" + ec.message() + "), copying instead");

    const std::string partial = target + ".part";
    std::filesystem::copy_file(source, partial, std::filesystem::copy_options::overwrite_existing, ec);
    if (!ec) {
        std::filesystem::rename(partial, target, ec);
    }
    if (ec) {
        logger::error("Failed to move " + source + " to " + target + ": " + ec.message());
        std::error_code ignored;
        std::filesystem::remove(partial, ignored);
        return false;
    }
    std::filesystem::remove(source, ec);
    return true;
}

static std::string makeUniqueDirectory(const std::string& prefix) {
    const auto base = std::filesystem::temp_directory_path() / (prefix + "XXXXXX");
#ifdef _WIN32
    std::random_device rd;
    for (int attempt = 0; attempt < 16; ++attempt) {
        auto candidate = std::filesystem::temp_directory_path() / (prefix + std::to_string(rd()));
        std::error_code ec;
        if (std::filesystem::create_directory(candidate, ec)) {
            return candidate.string();
        }
    }
    throw std::runtime_error("failed to create temporary directory under " + base.parent_path().string());
#else
    std::string pattern = base.string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error("failed to create temporary directory " + pattern + ": " + std::strerror(errno));
    }
    return std::string(buffer.data());
#endif
}

TempWorkspace::TempWorkspace(const std::string& prefix, const std::string& workName)
    : rootDir(makeUniqueDirectory(prefix)) {
    workingDir = (std::filesystem::path(rootDir) / workName).string();
    std::error_code ec;
    std::filesystem::create_directories(workingDir, ec);
    if (ec) {
        std::filesystem::remove_all(rootDir, ec);
        throw std::runtime_error("failed to create working directory " + workingDir);
    }
    logger::debug("Created temporary workspace: " + rootDir);
}

TempWorkspace::~TempWorkspace() {
    std::error_code ec;
    std::filesystem::remove_all(rootDir, ec);
    if (ec) {
        logger::warning("Failed to remove temporary workspace " + rootDir + ": " + ec.message());
    } else {
        logger::debug("Removed temporary workspace: " + rootDir);
    }
}

} // namespace fs
