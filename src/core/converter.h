#ifndef CORE_CONVERTER_H
#define CORE_CONVERTER_H

#include <optional>
#include <string>

#include "binary_resolver.h"
#include "types.h"
#include "../system/environment.h"
#include "../utils/process.h"

namespace core {

// Runs one 7z -> zip conversion end to end:
// validate input, resolve binary, probe, extract into a private temp dir,
// list entries, pack, verify. The temp dir is removed on every exit path.
// Errors are ConversionError subclasses, propagated from the failing step.
class Converter {
public:
    Converter(utils::ProcessRunner& runner, env::Environment environment, ResolverOptions resolverOptions);

    ConversionResult convert(const ConversionRequest& request);

private:
    utils::ProcessRunner& runner;
    env::Environment environment;
    ResolverOptions resolverOptions;
};

// Throws InputValidationError unless path names an existing regular .7z file
void validateInput(const std::string& inputPath);

// Resolver options from the loaded configuration (config::getSettings())
ResolverOptions resolverOptionsFromConfig();

// Entry point for callers that just want a zip: production runner, detected
// environment and configured overrides. Returns the output path.
std::string convert(const std::string& inputPath, const std::optional<std::string>& outputPath = std::nullopt);

} // namespace core

#endif // CORE_CONVERTER_H
