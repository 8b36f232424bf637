#include "zip_packer.h"
#include "errors.h"
#include "output_parser.h"
#include "../system/fs.h"
#include "../system/logger.h"

#include <filesystem>

namespace core {

ZipPacker::ZipPacker(utils::ProcessRunner& runner, const env::Environment& environment)
    : runner(runner), environment(environment) {}

std::vector<ZipPacker::Tier> ZipPacker::tiers() const {
    const std::string mmt = "-mmt=" + std::to_string(environment.cpuCount);
    return {
        {"full", {"a", "-tzip", "-mx=7", mmt, "-mtm=on", "-mtc=on", "-mta=on"},
         [](const utils::ExecutionResult&) { return true; }},
        {"no-times", {"a", "-tzip", "-mx=7", mmt},
         [](const utils::ExecutionResult& prev) { return isArgumentRejected(prev.combinedOutput); }},
        {"single", {"a", "-tzip", "-mx=9"},
         [](const utils::ExecutionResult& prev) {
             return isUnsupportedSwitch(prev.combinedOutput) && mentionsMultithreadSwitch(prev.combinedOutput);
         }},
    };
}

void ZipPacker::packWithTiers(const std::string& binary,
                              const std::string& outZip,
                              const std::vector<Entry>& entries,
                              const std::string& cwd,
                              const std::string& listFile) {
    std::string listing;
    for (const auto& entry : entries) {
        listing += entry;
        listing += '\n';
    }
    if (!fs::writeFile(listFile, listing)) {
        throw PackingFailure(-1, "cannot write entry list " + listFile);
    }

    utils::RunOptions options;
    options.workingDirectory = cwd;

    utils::ExecutionResult last;
    bool attempted = false;
    for (const auto& tier : tiers()) {
        if (attempted && (last.exitCode == 0 || !tier.appliesAfter(last))) {
            continue;
        }
        std::vector<std::string> args = tier.switches;
        args.push_back(outZip);
        args.push_back("@" + listFile);
        if (attempted) {
            logger::info("retrying zip creation with '" + tier.name + "' switches");
        }
        last = runner.run(binary, args, options);
        attempted = true;
    }

    if (last.exitCode != 0) {
        throw PackingFailure(last.exitCode, last.combinedOutput);
    }
}

void ZipPacker::pack(const std::string& binary,
                     const std::string& outZip,
                     const std::vector<Entry>& entries,
                     const std::string& cwd,
                     const std::string& listFile) {
    logger::info("addZipWith7z to: " + outZip);
    if (!entries.empty()) {
        packWithTiers(binary, outZip, entries, cwd, listFile);
        return;
    }

    // 7z cannot create a zip from nothing: add a placeholder, then delete it
    const auto placeholder = (std::filesystem::path(cwd) / EMPTY_PLACEHOLDER).string();
    if (!fs::writeFile(placeholder)) {
        throw PackingFailure(-1, "cannot create placeholder " + placeholder);
    }
    packWithTiers(binary, outZip, {EMPTY_PLACEHOLDER}, cwd, listFile);
    auto removed = runner.run(binary, {"d", outZip, EMPTY_PLACEHOLDER});
    if (removed.exitCode != 0) {
        logger::debug("placeholder removal exited with " + std::to_string(removed.exitCode));
    }
}

} // namespace core
