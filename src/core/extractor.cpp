#include "extractor.h"
#include "errors.h"
#include "output_parser.h"
#include "../system/config.h"
#include "../system/logger.h"

namespace core {

void extract(utils::ProcessRunner& runner,
             const std::string& binary,
             const std::string& filePath,
             const std::string& outDir,
             const std::string& versionOutput,
             const env::Environment& environment) {
    logger::info("extracting 7z to workDir: " + outDir);
    auto r = runner.run(binary, {"x", "-o" + outDir, "-y", "-bd", "--", filePath});
    if (r.exitCode == 0) {
        return;
    }

    if (isFatalFailure(r.combinedOutput) && isLegacyP7zip1602(versionOutput)) {
        throw ExtractionFailure(
            ExtractionFailure::Kind::KnownBrokenBinary,
            "p7zip 16.02 failed with E_FAIL while extracting. Provide the official 7-Zip 7zz (e.g. 7zz-" +
            environment.platformTag + ") in ./bin, ./vendors or " + config::ENV_BIN_DIR +
            ", or point " + config::ENV_BIN + " at it.\nOriginal output:\n" + r.combinedOutput);
    }
    if (r.combinedOutput.empty()) {
        throw ExtractionFailure(ExtractionFailure::Kind::Generic,
                                "7z extraction failed exitCode=" + std::to_string(r.exitCode));
    }
    throw ExtractionFailure(ExtractionFailure::Kind::Generic, r.combinedOutput);
}

} // namespace core
