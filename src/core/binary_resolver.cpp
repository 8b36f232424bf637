#include "binary_resolver.h"
#include "errors.h"
#include "output_parser.h"
#include "../system/fs.h"
#include "../system/logger.h"

#include <filesystem>
#include <system_error>
#include <utility>

namespace core {

static const std::vector<std::string> kVersionArgs = {"-version"};

static std::string preview(const std::string& text, std::size_t limit = 120) {
    if (text.size() <= limit) return text;
    return text.substr(0, limit) + "...";
}

std::string defaultEmbeddedBinary() {
#ifdef SZ2ZIP_EMBEDDED_7ZA
    return SZ2ZIP_EMBEDDED_7ZA;
#else
    std::string exeDir = fs::getExecutablePath();
    if (exeDir.empty()) {
        return "7za";
    }
    return (std::filesystem::path(exeDir) / "7za").string();
#endif
}

BinaryResolver::BinaryResolver(utils::ProcessRunner& runner, const env::Environment& environment, ResolverOptions options)
    : runner(runner), environment(environment), options(std::move(options)) {}

std::vector<std::string> BinaryResolver::candidateNames() const {
    const std::string& tag = environment.platformTag;
    return {
        "7zzs-" + tag, "7zzs",
        "7zz-" + tag,  "7zz",
        "7z-" + tag,   "7z",
        "7za-" + tag,  "7za",
    };
}

std::vector<std::string> BinaryResolver::candidateDirectories() const {
    std::filesystem::path base = options.baseDir;
    if (base.empty()) {
        std::error_code ec;
        base = std::filesystem::current_path(ec);
    }
    std::vector<std::string> dirs;
    if (!options.binDir.empty()) {
        dirs.push_back(options.binDir);
    }
    dirs.push_back((base / "bin").string());
    dirs.push_back((base / "vendors").string());
    return dirs;
}

std::optional<ResolvedBinary> BinaryResolver::tryCandidate(const BinaryCandidate& candidate) {
    try {
        auto r = runner.run(candidate.pathOrName, kVersionArgs);
        if (hasSevenZipSignature(r.combinedOutput)) {
            return ResolvedBinary{candidate.pathOrName, r.combinedOutput, candidate.source};
        }
        logger::debug("candidate " + candidate.pathOrName + " unusable: " + preview(r.combinedOutput));
    } catch (const utils::ProcessLaunchError& e) {
        logger::debug("candidate " + candidate.pathOrName + " unusable: " + preview(e.what()));
    }
    return std::nullopt;
}

std::optional<ResolvedBinary> BinaryResolver::fromOverride() {
    if (options.binPath.empty()) {
        return std::nullopt;
    }
    fs::ensureExecutable(options.binPath);
    auto found = tryCandidate({options.binPath, CandidateSource::ExplicitOverride});
    if (!found) {
        logger::warning("Configured 7z binary is not usable: " + options.binPath);
    }
    return found;
}

std::optional<ResolvedBinary> BinaryResolver::fromDirectories() {
    const auto names = candidateNames();
    for (const auto& dir : candidateDirectories()) {
        for (const auto& name : names) {
            const auto full = (std::filesystem::path(dir) / name).string();
            std::error_code ec;
            if (!std::filesystem::exists(full, ec)) {
                continue;
            }
            fs::ensureExecutable(full);
            if (auto found = tryCandidate({full, CandidateSource::KnownDirectory})) {
                return found;
            }
        }
    }
    return std::nullopt;
}

std::optional<ResolvedBinary> BinaryResolver::fromSearchPath() {
    for (const auto& name : candidateNames()) {
        if (auto found = tryCandidate({name, CandidateSource::SearchPath})) {
            return found;
        }
    }
    return std::nullopt;
}

ResolvedBinary BinaryResolver::fromEmbedded() {
    const std::string bin = options.embeddedBin.empty() ? defaultEmbeddedBinary() : options.embeddedBin;
    std::string version;
    try {
        version = runner.run(bin, kVersionArgs).combinedOutput;
    } catch (const utils::ProcessLaunchError& e) {
        throw ResolutionFailure("no usable 7-Zip binary found; embedded fallback " + bin +
                                " could not be started: " + e.what());
    }
    if (!hasSevenZipSignature(version)) {
        logger::warning("Embedded 7za did not identify itself, using it anyway: " + bin);
    }
    return ResolvedBinary{bin, version, CandidateSource::EmbeddedFallback};
}

std::vector<BinaryResolver::Tier> BinaryResolver::tiers() {
    return {
        {"explicit override", [this] { return fromOverride(); }},
        {"candidate directories", [this] { return fromDirectories(); }},
        {"PATH", [this] { return fromSearchPath(); }},
        {"embedded fallback", [this] { return std::optional<ResolvedBinary>(fromEmbedded()); }},
    };
}

ResolvedBinary BinaryResolver::resolve() {
    for (auto& tier : tiers()) {
        if (auto found = tier.attempt()) {
            logger::debug("7z resolved via " + tier.name + ": " + found->binary);
            return *found;
        }
    }
    // fromEmbedded either returns or throws
    throw ResolutionFailure("no usable 7-Zip binary found");
}

} // namespace core
