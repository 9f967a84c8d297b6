/**
 * @file output_capture.hpp
 * @brief Collection of declared output files from a scan workspace
 *
 * Tools declare the files they will write. Before a run the engine records
 * a fingerprint (existence, size, modification time) of each declared
 * path; after the run it reports exactly those paths whose fingerprint
 * changed. Files that were never written are omitted without error.
 *
 * Declared paths are workspace-relative. A leading "/" or "/workspace/" is
 * accepted so tools can be given the path they see inside the sandbox.
 *
 * @date 2025
 */

#pragma once

#include "threatweaver/core/execution_result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace threatweaver {
namespace core {

/// Mount point of the scan workspace inside every sandbox.
constexpr const char* kSandboxWorkspaceDir = "/workspace";

/**
 * @struct FileFingerprint
 * @brief Cheap identity of a file's state at one point in time
 */
struct FileFingerprint {
    bool exists{false};
    std::uintmax_t size{0};
    std::filesystem::file_time_type mtime{};

    bool operator==(const FileFingerprint& other) const {
        return exists == other.exists && size == other.size && mtime == other.mtime;
    }
    bool operator!=(const FileFingerprint& other) const { return !(*this == other); }
};

/**
 * @struct OutputSnapshot
 * @brief Fingerprints of all declared outputs taken before a run
 */
struct OutputSnapshot {
    std::filesystem::path workspace;
    std::map<std::string, FileFingerprint> before;  ///< Declared path -> fingerprint
};

/**
 * @class OutputCapture
 * @brief Snapshot / collect pair used by every backend
 */
class OutputCapture {
public:
    /**
     * @brief Map a declared path into the workspace
     * @return Absolute host path, or nullopt if the path escapes the workspace
     */
    static std::optional<std::filesystem::path> ResolveDeclaredPath(
        const std::filesystem::path& workspace,
        const std::string& declared);

    /**
     * @brief Workspace-relative form of a declared path ("/workspace/a/b" -> "a/b")
     * @return Empty string if the path escapes the workspace
     */
    static std::string RelativeDeclaredPath(const std::string& declared);

    static FileFingerprint Fingerprint(const std::filesystem::path& path);

    /// Record the state of every declared output before execution.
    static OutputSnapshot Snapshot(const std::filesystem::path& workspace,
                                   const std::vector<std::string>& declared);

    /**
     * @brief Read declared outputs that were created or modified
     *
     * Fills result.output_files and result.truncated_output_files. Paths
     * that escape the workspace, symlinks and non-regular files are skipped
     * with a warning. Never throws.
     *
     * @param snapshot State recorded before the run
     * @param max_file_bytes Per-file ceiling; longer files are cut
     * @param result Result to fill
     */
    static void Collect(const OutputSnapshot& snapshot,
                        std::size_t max_file_bytes,
                        SandboxExecutionResult& result);
};

} // namespace core
} // namespace threatweaver
