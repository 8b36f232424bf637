#include "errors.h"

namespace core {

ConversionError::ConversionError(const std::string& message) : std::runtime_error(message) {}

ResolutionFailure::ResolutionFailure(const std::string& message) : ConversionError(message) {}

InputValidationError::InputValidationError(const std::string& message) : ConversionError(message) {}

EncryptedArchiveError::EncryptedArchiveError(const std::string& message) : ConversionError(message) {}

InvalidArchiveError::InvalidArchiveError(const std::string& message) : ConversionError(message) {}

ExtractionFailure::ExtractionFailure(Kind kind, const std::string& message)
    : ConversionError(message), failureKind(kind) {}

PackingFailure::PackingFailure(int exitCode, const std::string& output)
    : ConversionError("failed to create zip (exitCode=" + std::to_string(exitCode) + ")\n" + output),
      code(exitCode), toolOutput(output) {}

OutputMissingError::OutputMissingError(const std::string& message) : ConversionError(message) {}

} // namespace core
