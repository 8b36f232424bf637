#include "types.h"

namespace core {

static nlohmann::json optionalCount(const std::optional<int>& v) {
    if (v) return *v;
    return nullptr;
}

void to_json(nlohmann::json& j, const ZipStats& v) {
    j = nlohmann::json{{"files", v.files}, {"folders", v.folders}};
}

void to_json(nlohmann::json& j, const ConversionResult& v) {
    j = nlohmann::json{
        {"output", v.outputPath},
        {"binary", v.binary},
        {"binarySource", v.binarySource},
        {"source", {{"files", optionalCount(v.sourceFiles)}, {"folders", optionalCount(v.sourceFolders)}}},
        {"entries", v.entryCount},
        {"verified", v.verified},
        {"sha256", v.sha256},
        {"elapsedMs", v.elapsedMs}
    };
}

const char* toString(CandidateSource source) {
    switch (source) {
        case CandidateSource::ExplicitOverride: return "explicit override";
        case CandidateSource::KnownDirectory:   return "known directory";
        case CandidateSource::SearchPath:       return "PATH";
        case CandidateSource::EmbeddedFallback: return "embedded fallback";
    }
    return "unknown";
}

} // namespace core
