/**
 * @file isolation_namespace.hpp
 * @brief Per-scan scoping of backend resources
 *
 * A scan identifier is the only key that groups backend resources. Raw
 * identifiers are caller-controlled, so they are never used directly in
 * resource names. Instead each identifier maps to a slug:
 *
 * ```
 * "Scan #42/ACME"  ->  "scan-42-acme-3f9a1c0b7d2e4f61"
 *  sanitized prefix ---^            ^--- first 16 hex chars of SHA-256(raw id)
 * ```
 *
 * The digest suffix keeps distinct identifiers apart even when their
 * sanitized prefixes collide ("a/b" and "a.b").
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <string>

namespace threatweaver {
namespace core {

/**
 * @class IsolationNamespace
 * @brief Derives backend-safe names and labels from a scan identifier
 *
 * **Usage Example**:
 * @code
 * IsolationNamespace ns("scan-a");
 * ns.NetworkName();    // "threatweaver-net-scan-a-<digest>"
 * ns.LabelSelector();  // "threatweaver.namespace=scan-a-<digest>"
 * @endcode
 */
class IsolationNamespace {
public:
    static constexpr std::size_t kMaxPrefixLength = 24;
    static constexpr std::size_t kDigestLength = 16;

    /**
     * @brief Build the namespace for a scan
     * @param scan_id Raw scan identifier
     * @param resource_prefix Prefix for every resource name
     * @throws std::invalid_argument if scan_id is empty or contains NUL
     */
    explicit IsolationNamespace(const std::string& scan_id,
                                const std::string& resource_prefix = "threatweaver");

    const std::string& ScanId() const { return scan_id_; }
    const std::string& Slug() const { return slug_; }
    const std::string& ResourcePrefix() const { return prefix_; }

    /// "<prefix>-<kind>-<slug>", e.g. kind "net" or "run".
    std::string ResourceName(const std::string& kind) const;

    std::string NetworkName() const { return ResourceName("net"); }

    /// Container label key / metadata key carrying the slug.
    std::string LabelKey() const { return prefix_ + ".namespace"; }
    std::string LabelSelector() const { return LabelKey() + "=" + slug_; }

    /// Metadata key for backends whose keys may not contain dots.
    std::string MetadataKey() const { return prefix_ + "_ns"; }

    /// Lowercase [a-z0-9-] form of arbitrary text, "scan" if nothing survives.
    static std::string SanitizeComponent(const std::string& text, std::size_t max_length);

private:
    std::string scan_id_;
    std::string prefix_;
    std::string slug_;
};

} // namespace core
} // namespace threatweaver
