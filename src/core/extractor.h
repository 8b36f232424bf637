#ifndef CORE_EXTRACTOR_H
#define CORE_EXTRACTOR_H

#include <string>
#include "../system/environment.h"
#include "../utils/process.h"

namespace core {

// Unpacks filePath into outDir with overwrite. Throws ExtractionFailure; the
// KnownBrokenBinary kind is used when p7zip 16.02 hits E_FAIL, with a hint to
// supply an official 7zz instead.
void extract(utils::ProcessRunner& runner,
             const std::string& binary,
             const std::string& filePath,
             const std::string& outDir,
             const std::string& versionOutput,
             const env::Environment& environment);

} // namespace core

#endif // CORE_EXTRACTOR_H
