#include "probe.h"
#include "output_parser.h"
#include "../system/logger.h"

namespace core {

static std::string countOrUnknown(const std::optional<int>& v) {
    return v ? std::to_string(*v) : std::string("unknown");
}

ProbeResult probe(utils::ProcessRunner& runner, const std::string& binary, const std::string& filePath) {
    auto r = runner.run(binary, {"l", "-slt", "--", filePath});
    ProbeResult result = parseProbeOutput(r.exitCode, r.combinedOutput);
    logger::debug(std::string("probe: isType7z=") + (result.isRecognizedFormat ? "true" : "false") +
                  " isEncrypted=" + (result.isEncrypted ? "true" : "false") +
                  " looksInvalid=" + (result.looksInvalid ? "true" : "false") +
                  " files=" + countOrUnknown(result.fileCount) +
                  " folders=" + countOrUnknown(result.folderCount));
    return result;
}

ZipStats verify(utils::ProcessRunner& runner, const std::string& binary, const std::string& zipPath) {
    auto r = runner.run(binary, {"l", "-slt", "--", zipPath});
    ZipStats stats = parseZipStats(r.combinedOutput);
    logger::debug("verify zip: files=" + std::to_string(stats.files) + " folders=" + std::to_string(stats.folders));
    return stats;
}

} // namespace core
