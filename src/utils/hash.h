#ifndef UTILS_HASH_H
#define UTILS_HASH_H

#include <string>

namespace utils {
    // Lowercase hex SHA-256 of the file bytes; empty if the file cannot be read
    // (used for the conversion report checksum)
    std::string computeFileSha256(const std::string& filePath);
}

#endif // UTILS_HASH_H


