#ifndef CORE_BINARY_RESOLVER_H
#define CORE_BINARY_RESOLVER_H

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "types.h"
#include "../system/environment.h"
#include "../utils/process.h"

namespace core {

struct ResolverOptions {
    std::string binPath;      // explicit override, validated like any other candidate
    std::string binDir;       // searched before the conventional directories
    std::string embeddedBin;  // empty = defaultEmbeddedBinary()
    std::string baseDir;      // root for bin/ and vendors/, empty = current directory
};

// Bundled 7za: SZ2ZIP_EMBEDDED_7ZA if the build defines it, else 7za beside the executable
std::string defaultEmbeddedBinary();

// Finds a working 7-Zip executable. Tiers are tried in order, first hit wins:
//   1. explicit override path
//   2. candidate names inside candidate directories
//   3. candidate names on PATH
//   4. embedded fallback, taken even if its banner is not recognized
// Nothing is cached; every resolve() walks the tiers again.
class BinaryResolver {
public:
    BinaryResolver(utils::ProcessRunner& runner, const env::Environment& environment, ResolverOptions options);

    ResolvedBinary resolve();

    // Platform-qualified names first, generic second
    std::vector<std::string> candidateNames() const;
    std::vector<std::string> candidateDirectories() const;

private:
    struct Tier {
        std::string name;
        std::function<std::optional<ResolvedBinary>()> attempt;
    };

    std::vector<Tier> tiers();
    std::optional<ResolvedBinary> tryCandidate(const BinaryCandidate& candidate);
    std::optional<ResolvedBinary> fromOverride();
    std::optional<ResolvedBinary> fromDirectories();
    std::optional<ResolvedBinary> fromSearchPath();
    ResolvedBinary fromEmbedded();

    utils::ProcessRunner& runner;
    env::Environment environment;
    ResolverOptions options;
};

} // namespace core

#endif // CORE_BINARY_RESOLVER_H
