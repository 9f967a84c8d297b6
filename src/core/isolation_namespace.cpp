/**
 * @file isolation_namespace.cpp
 * @brief Slug derivation for scan namespaces
 *
 * @date 2025
 */

#include "threatweaver/core/isolation_namespace.hpp"
#include "threatweaver/utils/hash_utils.hpp"

#include <stdexcept>

namespace threatweaver {
namespace core {

std::string IsolationNamespace::SanitizeComponent(const std::string& text, std::size_t max_length) {
    std::string out;
    out.reserve(text.size());

    bool last_dash = true;  // suppresses leading dashes
    for (unsigned char c : text) {
        if (out.size() >= max_length) {
            break;
        }
        if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
            out += static_cast<char>(c);
            last_dash = false;
        } else if (c >= 'A' && c <= 'Z') {
            out += static_cast<char>(c - 'A' + 'a');
            last_dash = false;
        } else if (!last_dash) {
            out += '-';
            last_dash = true;
        }
    }

    while (!out.empty() && out.back() == '-') {
        out.pop_back();
    }
    return out.empty() ? std::string("scan") : out;
}

IsolationNamespace::IsolationNamespace(const std::string& scan_id,
                                       const std::string& resource_prefix)
    : scan_id_(scan_id) {
    if (scan_id.empty()) {
        throw std::invalid_argument("scan id must not be empty");
    }
    if (scan_id.find('\0') != std::string::npos) {
        throw std::invalid_argument("scan id must not contain NUL bytes");
    }

    prefix_ = SanitizeComponent(resource_prefix.empty() ? "threatweaver" : resource_prefix,
                                kMaxPrefixLength);

    std::string digest = utils::HashUtils::ComputeSHA256(scan_id);
    slug_ = SanitizeComponent(scan_id, kMaxPrefixLength) + "-" + digest.substr(0, kDigestLength);
}

std::string IsolationNamespace::ResourceName(const std::string& kind) const {
    return prefix_ + "-" + kind + "-" + slug_;
}

} // namespace core
} // namespace threatweaver
