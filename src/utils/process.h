#ifndef UTILS_PROCESS_H
#define UTILS_PROCESS_H

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace utils {

// The program could not be started at all (missing, not executable, wrong
// architecture). A program that started and exited non-zero is not an error.
class ProcessLaunchError : public std::runtime_error {
public:
    explicit ProcessLaunchError(const std::string& message);
};

struct ExecutionResult {
    int exitCode = 0;
    std::string combinedOutput;  // stdout and stderr interleaved
};

struct RunOptions {
    std::optional<std::string> workingDirectory;
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Runs to completion. Throws ProcessLaunchError only when launch fails.
    virtual ExecutionResult run(const std::string& binary,
                                const std::vector<std::string>& args,
                                const RunOptions& options = RunOptions()) = 0;
};

// Runs through the platform shell with popen, stderr folded into stdout.
class ShellProcessRunner : public ProcessRunner {
public:
    ExecutionResult run(const std::string& binary,
                        const std::vector<std::string>& args,
                        const RunOptions& options = RunOptions()) override;
};

// Quotes one argument so the shell passes it through verbatim
std::string shellQuote(const std::string& arg);

// Full command line as handed to the shell (without redirections)
std::string buildCommandLine(const std::string& binary,
                             const std::vector<std::string>& args,
                             const RunOptions& options);

} // namespace utils

#endif // UTILS_PROCESS_H
