/**
 * @file hash_utils.cpp
 * @brief Implementation of digest helpers
 *
 * @date 2025
 */

#include "threatweaver/utils/hash_utils.hpp"

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace threatweaver {
namespace utils {

std::string HashUtils::BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string HashUtils::ComputeSHA256(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return BinaryToHex(hash, SHA256_DIGEST_LENGTH);
}

std::string HashUtils::RandomHex(std::size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (bytes > 0 && RAND_bytes(buffer.data(), static_cast<int>(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return BinaryToHex(buffer.data(), buffer.size());
}

} // namespace utils
} // namespace threatweaver
