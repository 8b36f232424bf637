#ifndef CORE_ENTRY_LISTER_H
#define CORE_ENTRY_LISTER_H

#include <string>
#include <vector>
#include "types.h"

namespace core {

// Depth-first listing of everything under rootDir, relative to it.
// Directories come as "dir/" before their contents so that empty ones survive
// the repack; files as plain relative paths. Symlinks are listed, not followed.
std::vector<Entry> listEntries(const std::string& rootDir);

} // namespace core

#endif // CORE_ENTRY_LISTER_H
