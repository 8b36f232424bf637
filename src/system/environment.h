#ifndef ENVIRONMENT_H
#define ENVIRONMENT_H

#include <string>

namespace env {

// Host facts computed once and handed to whoever needs them.
struct Environment {
    std::string platformTag;   // "<os>-<arch>", e.g. "linux-x64", "darwin-arm64"
    unsigned cpuCount = 1;     // logical CPUs, never 0
    char pathSeparator = '/';

    static Environment detect();
};

// Maps compiler-defined OS/arch macros onto the tag used in binary names.
std::string detectPlatformTag();

}

#endif // ENVIRONMENT_H
