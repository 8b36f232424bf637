#ifndef CORE_ZIP_PACKER_H
#define CORE_ZIP_PACKER_H

#include <functional>
#include <string>
#include <vector>

#include "types.h"
#include "../system/environment.h"
#include "../utils/process.h"

namespace core {

// Name of the stand-in file used to produce a zip with no entries
constexpr const char* EMPTY_PLACEHOLDER = ".zip_empty_placeholder";

// Builds a zip from an explicit entry list, never from "the whole directory".
// The entries go to 7-Zip through a list file ("@file"), one per line, so the
// command line stays short and names starting with '-' or '@' are not parsed
// as switches.
//
// Argument sets are tried from most to least featured, each at most once:
//   full       -mx=7 -mmt=N plus -mtm/-mtc/-mta timestamps
//   no-times   same without the timestamp switches (older 7z rejects them)
//   single     -mx=9 only (very old 7z rejects -mmt)
class ZipPacker {
public:
    struct Tier {
        std::string name;
        std::vector<std::string> switches;
        // Decides from the previous failed attempt whether this tier is worth running
        std::function<bool(const utils::ExecutionResult&)> appliesAfter;
    };

    ZipPacker(utils::ProcessRunner& runner, const env::Environment& environment);

    // listFile is (re)written with the entries and must live outside cwd.
    // Throws PackingFailure if every applicable tier fails
    void pack(const std::string& binary,
              const std::string& outZip,
              const std::vector<Entry>& entries,
              const std::string& cwd,
              const std::string& listFile);

    std::vector<Tier> tiers() const;

private:
    void packWithTiers(const std::string& binary,
                       const std::string& outZip,
                       const std::vector<Entry>& entries,
                       const std::string& cwd,
                       const std::string& listFile);

    utils::ProcessRunner& runner;
    env::Environment environment;
};

} // namespace core

#endif // CORE_ZIP_PACKER_H
