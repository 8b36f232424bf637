#ifndef CLI_H
#define CLI_H

namespace cli {

// Exit codes of the command-line tool
constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_CONVERSION_FAILED = 2;

// Parses arguments, runs the conversion and returns the process exit code
int runCommand(int argc, char** argv);

}

#endif // CLI_H
