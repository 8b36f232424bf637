#include "entry_lister.h"
#include <filesystem>

namespace core {

static void walk(const std::filesystem::path& root, const std::filesystem::path& rel, std::vector<Entry>& out) {
    for (const auto& item : std::filesystem::directory_iterator(root / rel)) {
        const auto childRel = rel / item.path().filename();
        // generic form: "/" separators on every platform
        const std::string posix = childRel.generic_string();
        if (item.is_directory() && !item.is_symlink()) {
            out.push_back(posix + "/");
            walk(root, childRel, out);
        } else {
            out.push_back(posix);
        }
    }
}

std::vector<Entry> listEntries(const std::string& rootDir) {
    std::vector<Entry> entries;
    walk(std::filesystem::path(rootDir), std::filesystem::path(), entries);
    return entries;
}

} // namespace core
