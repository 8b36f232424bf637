#include "process.h"
#include "../system/logger.h"

#include <cstdio>
#include <cstdlib>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace utils {

// Exit statuses POSIX shells use for "found but cannot execute" / "not found"
static constexpr int SHELL_CANNOT_EXECUTE = 126;
static constexpr int SHELL_NOT_FOUND = 127;

ProcessLaunchError::ProcessLaunchError(const std::string& message)
    : std::runtime_error(message) {}

std::string shellQuote(const std::string& arg) {
#ifdef _WIN32
    std::string out = "\"";
    for (char c : arg) {
        if (c == '"') out += "\\\"";
        else out.push_back(c);
    }
    out += "\"";
    return out;
#else
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out += "'";
    return out;
#endif
}

std::string buildCommandLine(const std::string& binary,
                             const std::vector<std::string>& args,
                             const RunOptions& options) {
    std::string command = shellQuote(binary);
    for (const auto& arg : args) {
        command += " ";
        command += shellQuote(arg);
    }
    if (options.workingDirectory && !options.workingDirectory->empty()) {
        command = "cd " + shellQuote(*options.workingDirectory) + " && " + command;
    }
    return command;
}

static int decodeStatus(int status) {
#ifdef _WIN32
    return status;
#else
    if (status == -1) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return status;
#endif
}

ExecutionResult ShellProcessRunner::run(const std::string& binary,
                                        const std::vector<std::string>& args,
                                        const RunOptions& options) {
    std::string command = buildCommandLine(binary, args, options);
    logger::info("RUN> " + command);

    std::string fullCommand = command + " 2>&1";
#ifdef _WIN32
    FILE* pipe = _popen(fullCommand.c_str(), "r");
#else
    FILE* pipe = popen(fullCommand.c_str(), "r");
#endif
    if (!pipe) {
        throw ProcessLaunchError("failed to start shell for: " + command);
    }

    ExecutionResult result;
    char buffer[4096];
    size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.combinedOutput.append(buffer, n);
    }

#ifdef _WIN32
    result.exitCode = decodeStatus(_pclose(pipe));
#else
    result.exitCode = decodeStatus(pclose(pipe));
#endif
    logger::info("exitCode=" + std::to_string(result.exitCode));
    if (!result.combinedOutput.empty()) {
        logger::debug("output>\n" + result.combinedOutput);
    }

    if (result.exitCode == SHELL_CANNOT_EXECUTE || result.exitCode == SHELL_NOT_FOUND) {
        throw ProcessLaunchError("cannot execute " + binary + " (exit " +
                                 std::to_string(result.exitCode) + "): " + result.combinedOutput);
    }
    if (result.exitCode < 0) {
        throw ProcessLaunchError("failed to wait for " + binary);
    }
    return result;
}

} // namespace utils
