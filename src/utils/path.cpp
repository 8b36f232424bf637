#include "path.h"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace utils {

std::string lowerExtension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string resolveZipOutputPath(const std::string& inputPath,
                                 const std::optional<std::string>& outputPath) {
    if (!outputPath || outputPath->empty()) {
        std::filesystem::path in(inputPath);
        return (in.parent_path() / (in.stem().string() + ".zip")).string();
    }
    if (lowerExtension(*outputPath) != ".zip") {
        return *outputPath + ".zip";
    }
    return *outputPath;
}

} // namespace utils
