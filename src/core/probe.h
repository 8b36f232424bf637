#ifndef CORE_PROBE_H
#define CORE_PROBE_H

#include <string>
#include "types.h"
#include "../utils/process.h"

namespace core {

// Non-mutating "l -slt" of the input, classified by parseProbeOutput()
ProbeResult probe(utils::ProcessRunner& runner, const std::string& binary, const std::string& filePath);

// Lists the produced zip and reports its Files/Folders summary (0 when absent).
// Diagnostic only: the counts are not compared against the source archive.
ZipStats verify(utils::ProcessRunner& runner, const std::string& binary, const std::string& zipPath);

} // namespace core

#endif // CORE_PROBE_H
