#ifndef CORE_ERRORS_H
#define CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace core {

// Base of everything convert() throws
class ConversionError : public std::runtime_error {
public:
    explicit ConversionError(const std::string& message);
};

// No candidate archive tool answered the version query recognizably
class ResolutionFailure : public ConversionError {
public:
    explicit ResolutionFailure(const std::string& message);
};

class InputValidationError : public ConversionError {
public:
    explicit InputValidationError(const std::string& message);
};

class EncryptedArchiveError : public ConversionError {
public:
    explicit EncryptedArchiveError(const std::string& message);
};

class InvalidArchiveError : public ConversionError {
public:
    explicit InvalidArchiveError(const std::string& message);
};

class ExtractionFailure : public ConversionError {
public:
    enum class Kind {
        Generic,
        KnownBrokenBinary
    };

    ExtractionFailure(Kind kind, const std::string& message);
    Kind kind() const { return failureKind; }

private:
    Kind failureKind;
};

class PackingFailure : public ConversionError {
public:
    PackingFailure(int exitCode, const std::string& output);
    int exitCode() const { return code; }
    const std::string& output() const { return toolOutput; }

private:
    int code;
    std::string toolOutput;
};

class OutputMissingError : public ConversionError {
public:
    explicit OutputMissingError(const std::string& message);
};

} // namespace core

#endif // CORE_ERRORS_H
