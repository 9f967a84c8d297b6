/**
 * @file string_utils.hpp
 * @brief String helpers shared by the sandbox backends
 *
 * Provides trimming, splitting, joining, encoding and sanitisation helpers
 * used when building backend commands, parsing backend replies and turning
 * raw tool output into diagnostics.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace threatweaver {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto parts = StringUtils::Split("a,b,,c", ',');          // {"a", "b", "c"}
 * auto encoded = StringUtils::ToBase64("hello\n");        // "aGVsbG8K"
 * auto excerpt = StringUtils::Tail(stderr_text, 512);     // last 512 bytes
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * String Manipulation
     ***************************************************************************/

    /**
     * @brief Remove leading and trailing whitespace
     * @param str Input string
     * @return Trimmed copy
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert to lowercase (ASCII only)
     * @param str Input string
     * @return Lowercase copy
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter, skipping empty tokens
     * @param str Input string
     * @param delimiter Delimiter character
     * @return Non-empty tokens in order
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Join strings with delimiter
     * @param strings Strings to join
     * @param delimiter Separator placed between elements
     * @return Joined string
     */
    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /***************************************************************************
     * Encoding
     ***************************************************************************/

    /**
     * @brief Encode bytes as standard Base64 (with padding)
     */
    static std::string ToBase64(const std::string& str);

    /**
     * @brief Decode standard Base64
     *
     * Stops at the first character outside the alphabet (including '=').
     *
     * @param base64 Encoded text
     * @return Decoded bytes
     */
    static std::string FromBase64(const std::string& base64);

    /**
     * @brief Percent-encode a string for use in a URL query component
     *
     * Unreserved characters (RFC 3986: ALPHA / DIGIT / "-" / "." / "_" / "~")
     * are kept, everything else becomes %XX.
     */
    static std::string UrlEncode(const std::string& str);

    /***************************************************************************
     * Sanitisation and Truncation
     ***************************************************************************/

    /**
     * @brief Replace non-printable characters with '.'
     *
     * Used before writing tool-controlled text into log lines.
     */
    static std::string Sanitize(const std::string& str);

    /**
     * @brief Last max_length bytes of a string
     *
     * Diagnostics favour the end of stderr, where tools print their fatal
     * message.
     */
    static std::string Tail(const std::string& str, std::size_t max_length);

    /**
     * @brief Check that a name is a valid POSIX environment variable name
     *
     * Accepts [A-Za-z_][A-Za-z0-9_]*.
     */
    static bool IsValidEnvName(const std::string& name);
};

} // namespace utils
} // namespace threatweaver
