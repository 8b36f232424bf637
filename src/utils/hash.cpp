#include "hash.h"
#include <fstream>
#include <vector>
#include <filesystem>
#include <picosha2.h>

namespace utils {

std::string computeFileSha256(const std::string& filePath) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(filePath, ec)) {
        return "";
    }
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        return "";
    }
    std::vector<unsigned char> digest(picosha2::k_digest_size);
    picosha2::hash256(file, digest.begin(), digest.end());
    return picosha2::bytes_to_hex_string(digest.begin(), digest.end());
}

} // namespace utils
