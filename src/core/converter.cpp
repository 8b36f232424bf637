#include "converter.h"
#include "entry_lister.h"
#include "errors.h"
#include "extractor.h"
#include "probe.h"
#include "zip_packer.h"
#include "../system/config.h"
#include "../system/fs.h"
#include "../system/logger.h"
#include "../utils/hash.h"
#include "../utils/path.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <system_error>
#include <utility>

namespace core {

static constexpr std::size_t ENTRY_PREVIEW_LIMIT = 40;
static constexpr const char* STAGED_ZIP_NAME = "out.zip";
static constexpr const char* ENTRY_LIST_NAME = "entries.txt";

static void logEntryPreview(const std::vector<Entry>& entries, const ProbeResult& probed) {
    if (!logger::isDebugEnabled()) {
        return;
    }
    if (entries.empty()) {
        logger::debug("work dir is empty (probe files=" +
                      (probed.fileCount ? std::to_string(*probed.fileCount) : std::string("unknown")) + ")");
        return;
    }
    std::string preview = "entries preview:";
    const std::size_t shown = std::min(entries.size(), ENTRY_PREVIEW_LIMIT);
    for (std::size_t i = 0; i < shown; ++i) {
        preview += "\n  " + entries[i];
    }
    if (entries.size() > shown) {
        preview += "\n  ...(+" + std::to_string(entries.size() - shown) + ")";
    }
    logger::debug(preview);
}

void validateInput(const std::string& inputPath) {
    if (inputPath.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw InputValidationError("input path must not be empty");
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(inputPath, ec)) {
        throw InputValidationError("file not found: " + inputPath);
    }
    if (utils::lowerExtension(inputPath) != ".7z") {
        throw InputValidationError("only .7z files are supported: " + inputPath);
    }
}

Converter::Converter(utils::ProcessRunner& runner, env::Environment environment, ResolverOptions resolverOptions)
    : runner(runner), environment(std::move(environment)), resolverOptions(std::move(resolverOptions)) {}

ConversionResult Converter::convert(const ConversionRequest& request) {
    const auto started = std::chrono::steady_clock::now();

    validateInput(request.inputPath);

    BinaryResolver resolver(runner, environment, resolverOptions);
    const ResolvedBinary tool = resolver.resolve();
    logger::info("using 7z candidate: " + tool.binary + " (" + toString(tool.source) + ")");
    if (!tool.versionOutput.empty()) {
        logger::debug("7z version>\n" + tool.versionOutput);
    }

    ConversionResult result;
    result.binary = tool.binary;
    result.binarySource = tool.source;
    std::filesystem::path outZip;

    try {
        const ProbeResult probed = probe(runner, tool.binary, request.inputPath);
        if (probed.isEncrypted) {
            throw EncryptedArchiveError("the 7z archive is encrypted or needs a password, which is not supported: " +
                                        request.inputPath);
        }
        if (!probed.isRecognizedFormat || probed.looksInvalid || probed.exitCode != 0) {
            throw InvalidArchiveError("not a valid 7z archive or the archive is corrupt: " + request.inputPath);
        }
        result.sourceFiles = probed.fileCount;
        result.sourceFolders = probed.folderCount;

        result.outputPath = utils::resolveZipOutputPath(request.inputPath, request.outputPath);
        logger::info("output zip: " + result.outputPath);
        std::error_code ec;
        outZip = std::filesystem::absolute(result.outputPath, ec);
        if (ec) {
            throw InputValidationError("cannot resolve output path " + result.outputPath + ": " + ec.message());
        }

        fs::TempWorkspace workspace("conv-7z-zip-");
        logger::info("workDir: " + workspace.workDir());

        extract(runner, tool.binary, request.inputPath, workspace.workDir(), tool.versionOutput, environment);

        const std::vector<Entry> entries = listEntries(workspace.workDir());
        result.entryCount = entries.size();
        logger::info("entries found: " + std::to_string(entries.size()));
        logEntryPreview(entries, probed);

        // Built next to the work dir, so nothing reaches the output path until it is verified
        const auto stagedZip = (std::filesystem::path(workspace.root()) / STAGED_ZIP_NAME).string();
        const auto listFile = (std::filesystem::path(workspace.root()) / ENTRY_LIST_NAME).string();

        logger::info("creating zip with " + std::to_string(entries.size()) + " entries");
        ZipPacker packer(runner, environment);
        packer.pack(tool.binary, stagedZip, entries, workspace.workDir(), listFile);

        logger::info("verifying zip: " + stagedZip);
        result.verified = verify(runner, tool.binary, stagedZip);
        if (!std::filesystem::is_regular_file(stagedZip, ec)) {
            throw OutputMissingError("zip was not created: " + result.outputPath);
        }

        if (!fs::createDirectoryIfNotExists(outZip.parent_path().string())) {
            throw InputValidationError("cannot create output directory " + outZip.parent_path().string());
        }
        if (!fs::replaceFile(stagedZip, outZip.string())) {
            throw ConversionError("cannot move the zip into place: " + outZip.string());
        }
    } catch (const ConversionError&) {
        throw;
    } catch (const std::filesystem::filesystem_error& e) {
        throw ConversionError(std::string("filesystem error during conversion: ") + e.what());
    } catch (const utils::ProcessLaunchError& e) {
        throw ConversionError(std::string("archive tool stopped working: ") + e.what());
    } catch (const std::runtime_error& e) {
        // temp workspace could not be created
        throw ConversionError(e.what());
    }

    result.sha256 = utils::computeFileSha256(outZip.string());
    result.elapsedMs = static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count());
    logger::info("conversion finished in " + std::to_string(result.elapsedMs) + " ms");
    return result;
}

ResolverOptions resolverOptionsFromConfig() {
    const config::Settings settings = config::getSettings();
    ResolverOptions options;
    options.binPath = settings.binPath;
    options.binDir = settings.binDir;
    options.embeddedBin = settings.embeddedBin;
    return options;
}

std::string convert(const std::string& inputPath, const std::optional<std::string>& outputPath) {
    // Re-read on every call so overrides set after startup still apply
    config::loadEnvironment();
    if (config::getSettings().debug) {
        logger::setLevel(logger::Level::DEBUG);
    }
    utils::ShellProcessRunner runner;
    Converter converter(runner, env::Environment::detect(), resolverOptionsFromConfig());
    return converter.convert(ConversionRequest{inputPath, outputPath}).outputPath;
}

} // namespace core
