/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers shared by the sandbox backends
 *
 * @date 2025
 */

#include "threatweaver/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace threatweaver {
namespace utils {

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

// Convert to lowercase
std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

// Split string by delimiter
std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {  // Skip empty tokens
            tokens.push_back(token);
        }
    }

    return tokens;
}

// Join strings
std::string StringUtils::Join(const std::vector<std::string>& strings,
                             const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

// ============================================================================
// ENCODING
// ============================================================================
// The sandbox agent ships process output as base64 inside JSON events

std::string StringUtils::ToBase64(const std::string& str) {
    static const char base64_chars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string result;
    result.reserve(((str.size() + 2) / 3) * 4);
    int val = 0;
    int valb = -6;

    for (unsigned char c : str) {
        val = (val << 8) + c;
        valb += 8;

        while (valb >= 0) {
            result.push_back(base64_chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }

    if (valb > -6) {
        result.push_back(base64_chars[((val << 8) >> (valb + 8)) & 0x3F]);
    }

    while (result.size() % 4) {
        result.push_back('=');
    }

    return result;
}

std::string StringUtils::FromBase64(const std::string& base64) {
    static const std::string base64_chars =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string result;
    result.reserve((base64.size() / 4) * 3);
    std::vector<int> lookup(256, -1);

    for (int i = 0; i < 64; ++i) {
        lookup[static_cast<unsigned char>(base64_chars[i])] = i;
    }

    int val = 0;
    int valb = -8;

    for (unsigned char c : base64) {
        if (lookup[c] == -1) break;
        val = ((val << 6) + lookup[c]) & 0xFFFFFF;
        valb += 6;

        if (valb >= 0) {
            result.push_back(static_cast<char>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }

    return result;
}

std::string StringUtils::UrlEncode(const std::string& str) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }

    return oss.str();
}

// ============================================================================
// STRING SANITIZATION AND TRUNCATION
// ============================================================================

// Sanitize string for safe output
std::string StringUtils::Sanitize(const std::string& str) {
    std::string result;
    result.reserve(str.length());

    for (char c : str) {
        if (std::isprint(static_cast<unsigned char>(c))) {
            result += c;
        } else {
            result += '.';
        }
    }

    return result;
}

std::string StringUtils::Tail(const std::string& str, std::size_t max_length) {
    if (str.length() <= max_length) {
        return str;
    }
    return str.substr(str.length() - max_length);
}

bool StringUtils::IsValidEnvName(const std::string& name) {
    if (name.empty()) {
        return false;
    }

    auto first = static_cast<unsigned char>(name[0]);
    if (!(std::isalpha(first) || first == '_')) {
        return false;
    }

    return std::all_of(name.begin() + 1, name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

} // namespace utils
} // namespace threatweaver
