/**
 * @file hash_utils.hpp
 * @brief Cryptographic digests used to derive backend resource names
 *
 * Scan identifiers are caller-supplied and may contain characters that
 * container runtimes and cloud APIs reject. A SHA-256 digest of the raw
 * identifier gives every namespace a collision-resistant, charset-safe
 * suffix.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <cstddef>

namespace threatweaver {
namespace utils {

/**
 * @class HashUtils
 * @brief OpenSSL-backed digest helpers
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 of a byte string
     * @param data Input bytes
     * @return Lowercase hexadecimal digest (64 characters)
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Convert binary data to lowercase hexadecimal
     * @param data Binary buffer
     * @param length Number of bytes
     */
    static std::string BinaryToHex(const unsigned char* data, std::size_t length);

    /**
     * @brief Generate a random hexadecimal token
     *
     * Uses the OpenSSL CSPRNG so that sandbox names cannot be predicted by
     * code running in a neighbouring sandbox.
     *
     * @param bytes Number of random bytes (output has 2x characters)
     * @throws std::runtime_error if the CSPRNG fails
     */
    static std::string RandomHex(std::size_t bytes);
};

} // namespace utils
} // namespace threatweaver
