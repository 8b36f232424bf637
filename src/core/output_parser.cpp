#include "output_parser.h"

#include <regex>
#include <sstream>
#include <stdexcept>

namespace core {

static bool search(const std::string& text, const char* pattern) {
    const std::regex re(pattern, std::regex::ECMAScript | std::regex::icase);
    return std::regex_search(text, re);
}

bool hasSevenZipSignature(const std::string& output) {
    return search(output, R"((7-?Zip|p7zip))");
}

bool isLegacyP7zip1602(const std::string& versionOutput) {
    return search(versionOutput, R"(p7zip Version 16\.02)");
}

bool detectPassword(const std::string& output) {
    if (search(output, R"(Wrong password|Enter password|Encrypted\s*=\s*\+)")) {
        return true;
    }
    if (search(output, R"(Headers Error)") && search(output, R"(password|encrypt)")) {
        return true;
    }
    if (search(output, R"(Data Error)") && search(output, R"(password)")) {
        return true;
    }
    return search(output, R"(Can not open encrypted archive)");
}

std::optional<int> parseCount(const std::string& output, const std::string& key) {
    const std::regex re("^\\s*" + key + "\\s*=\\s*(\\d+)", std::regex::ECMAScript | std::regex::icase);
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        std::smatch m;
        if (std::regex_search(line, m, re)) {
            try {
                return std::stoi(m[1].str());
            } catch (const std::out_of_range&) {
                return std::nullopt;
            }
        }
    }
    return std::nullopt;
}

ProbeResult parseProbeOutput(int exitCode, const std::string& output) {
    ProbeResult r;
    r.exitCode = exitCode;
    r.rawOutput = output;
    r.looksInvalid = search(output, R"(Can not open file as archive)") ||
                     ((search(output, R"(Errors:\s*\d+)") || search(output, R"(Warnings:\s*\d+)")) && exitCode != 0);
    r.isRecognizedFormat = search(output, R"(Type\s*=\s*7z)");
    r.isEncrypted = detectPassword(output);
    r.fileCount = parseCount(output, "Files");
    r.folderCount = parseCount(output, "Folders");
    return r;
}

ZipStats parseZipStats(const std::string& output) {
    ZipStats stats;
    stats.files = parseCount(output, "Files").value_or(0);
    stats.folders = parseCount(output, "Folders").value_or(0);
    return stats;
}

bool isFatalFailure(const std::string& output) {
    return search(output, R"(E_FAIL)");
}

bool isArgumentRejected(const std::string& output) {
    return search(output, R"(E_INVALIDARG|Unsupported switch|Incorrect command line)");
}

bool isUnsupportedSwitch(const std::string& output) {
    return search(output, R"(Unsupported switch)");
}

bool mentionsMultithreadSwitch(const std::string& output) {
    return search(output, R"(-mmt)");
}

} // namespace core
