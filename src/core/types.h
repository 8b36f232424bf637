#ifndef CORE_TYPES_H
#define CORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace core {

enum class CandidateSource {
    ExplicitOverride,
    KnownDirectory,
    SearchPath,
    EmbeddedFallback
};

struct BinaryCandidate {
    std::string pathOrName;     // full path, or bare name looked up on PATH
    CandidateSource source;
};

struct ResolvedBinary {
    std::string binary;
    std::string versionOutput;  // what "-version" printed, kept for diagnostics
    CandidateSource source = CandidateSource::EmbeddedFallback;
};

// Classification of a "l -slt" listing. Built once by parseProbeOutput().
struct ProbeResult {
    int exitCode = 0;
    std::string rawOutput;
    bool isRecognizedFormat = false;
    bool looksInvalid = false;
    bool isEncrypted = false;
    std::optional<int> fileCount;
    std::optional<int> folderCount;
};

// Relative, '/'-separated. A trailing '/' marks a directory.
using Entry = std::string;

struct ZipStats {
    int files = 0;
    int folders = 0;
};

struct ConversionRequest {
    std::string inputPath;
    std::optional<std::string> outputPath;
};

struct ConversionResult {
    std::string outputPath;
    std::string binary;
    CandidateSource binarySource = CandidateSource::EmbeddedFallback;
    std::optional<int> sourceFiles;
    std::optional<int> sourceFolders;
    std::size_t entryCount = 0;
    ZipStats verified;
    std::string sha256;
    std::uint64_t elapsedMs = 0;
};

// JSON serialization helpers
NLOHMANN_JSON_SERIALIZE_ENUM(CandidateSource, {
    {CandidateSource::ExplicitOverride, "explicit"},
    {CandidateSource::KnownDirectory, "directory"},
    {CandidateSource::SearchPath, "path"},
    {CandidateSource::EmbeddedFallback, "embedded"}
})

void to_json(nlohmann::json& j, const ZipStats& v);
void to_json(nlohmann::json& j, const ConversionResult& v);

const char* toString(CandidateSource source);

} // namespace core

#endif // CORE_TYPES_H
