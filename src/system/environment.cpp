#include "environment.h"
#include "logger.h"
#include <thread>

namespace env {

static const char* osName() {
#if defined(_WIN32)
    return "win32";
#elif defined(__APPLE__)
    return "darwin";
#elif defined(__FreeBSD__)
    return "freebsd";
#else
    return "linux";
#endif
}

static const char* archName() {
#if defined(__x86_64__) || defined(_M_X64)
    return "x64";
#elif defined(__aarch64__) || defined(_M_ARM64)
    return "arm64";
#elif defined(__arm__) || defined(_M_ARM)
    return "arm";
#elif defined(__i386__) || defined(_M_IX86)
    return "ia32";
#else
    return "unknown";
#endif
}

std::string detectPlatformTag() {
    return std::string(osName()) + "-" + archName();
}

Environment Environment::detect() {
    Environment e;
    e.platformTag = detectPlatformTag();
    unsigned n = std::thread::hardware_concurrency();
    e.cpuCount = n == 0 ? 1 : n;
#ifdef _WIN32
    e.pathSeparator = '\\';
#else
    e.pathSeparator = '/';
#endif
    logger::info("coreNum: " + std::to_string(e.cpuCount) + ", platformArch: " + e.platformTag);
    return e;
}

}
