#ifndef UTILS_PATH_H
#define UTILS_PATH_H

#include <optional>
#include <string>

namespace utils {
    // Lowercased extension including the dot ("" if there is none)
    std::string lowerExtension(const std::string& path);

    // Output path for a conversion: "<dir>/<stem>.zip" when none is given,
    // otherwise the given path with ".zip" appended unless it already ends so.
    std::string resolveZipOutputPath(const std::string& inputPath,
                                     const std::optional<std::string>& outputPath);
}

#endif // UTILS_PATH_H
