#ifndef CORE_OUTPUT_PARSER_H
#define CORE_OUTPUT_PARSER_H

#include <optional>
#include <string>
#include "types.h"

// Pure classification of 7-Zip console output. Nothing here runs a process.
namespace core {

// Does "-version" output look like any 7-Zip flavour (7-Zip, 7zip, p7zip)?
bool hasSevenZipSignature(const std::string& output);

// p7zip 16.02 fails with E_FAIL on some 7z archives during extraction
bool isLegacyP7zip1602(const std::string& versionOutput);

bool detectPassword(const std::string& output);

// Value of a "<key> = N" summary line, e.g. "Files = 3"
std::optional<int> parseCount(const std::string& output, const std::string& key);

ProbeResult parseProbeOutput(int exitCode, const std::string& output);

ZipStats parseZipStats(const std::string& output);

bool isFatalFailure(const std::string& output);                  // E_FAIL
bool isArgumentRejected(const std::string& output);              // E_INVALIDARG, bad switch, bad command line
bool isUnsupportedSwitch(const std::string& output);
bool mentionsMultithreadSwitch(const std::string& output);       // "-mmt" cited

} // namespace core

#endif // CORE_OUTPUT_PARSER_H
