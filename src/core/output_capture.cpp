/**
 * @file output_capture.cpp
 * @brief Declared output snapshot and collection
 *
 * **Containment**:
 * The workspace is writable from inside the sandbox, so a hostile tool can
 * replace a declared output with a symlink to a host file. Collection only
 * follows regular files whose canonical path stays inside the canonical
 * workspace.
 *
 * @date 2025
 */

#include "threatweaver/core/output_capture.hpp"
#include "threatweaver/utils/output_buffer.hpp"
#include "threatweaver/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace threatweaver {
namespace core {

using utils::StringUtils;

std::string OutputCapture::RelativeDeclaredPath(const std::string& declared) {
    std::string rel = declared;

    const std::string mount = std::string(kSandboxWorkspaceDir) + "/";
    if (StringUtils::StartsWith(rel, mount)) {
        rel = rel.substr(mount.size());
    }
    while (!rel.empty() && rel.front() == '/') {
        rel.erase(0, 1);
    }
    if (rel.empty()) {
        return "";
    }

    fs::path normal = fs::path(rel).lexically_normal();
    if (normal.empty() || normal == ".") {
        return "";
    }
    auto first = normal.begin();
    if (first != normal.end() && *first == "..") {
        return "";
    }

    std::string out = normal.generic_string();
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

std::optional<fs::path> OutputCapture::ResolveDeclaredPath(const fs::path& workspace,
                                                           const std::string& declared) {
    std::string rel = RelativeDeclaredPath(declared);
    if (rel.empty()) {
        return std::nullopt;
    }
    return workspace / rel;
}

FileFingerprint OutputCapture::Fingerprint(const fs::path& path) {
    FileFingerprint fp;
    std::error_code ec;

    auto status = fs::symlink_status(path, ec);
    if (ec || !fs::exists(status)) {
        return fp;
    }

    fp.exists = true;
    if (fs::is_regular_file(status)) {
        fp.size = fs::file_size(path, ec);
        if (ec) {
            fp.size = 0;
        }
    }
    fp.mtime = fs::last_write_time(path, ec);
    if (ec) {
        fp.mtime = fs::file_time_type{};
    }
    return fp;
}

OutputSnapshot OutputCapture::Snapshot(const fs::path& workspace,
                                       const std::vector<std::string>& declared) {
    OutputSnapshot snapshot;
    snapshot.workspace = workspace;

    for (const auto& path : declared) {
        auto resolved = ResolveDeclaredPath(workspace, path);
        if (!resolved) {
            snapshot.before[path] = FileFingerprint{};
            continue;
        }
        snapshot.before[path] = Fingerprint(*resolved);
    }
    return snapshot;
}

void OutputCapture::Collect(const OutputSnapshot& snapshot,
                            std::size_t max_file_bytes,
                            SandboxExecutionResult& result) {
    std::error_code ec;
    fs::path root = fs::weakly_canonical(snapshot.workspace, ec);
    if (ec) {
        spdlog::warn("Cannot resolve workspace {}: {}", snapshot.workspace.string(), ec.message());
        return;
    }

    for (const auto& [declared, before] : snapshot.before) {
        auto resolved = ResolveDeclaredPath(snapshot.workspace, declared);
        if (!resolved) {
            spdlog::warn("Skipping declared output '{}': path escapes the workspace", declared);
            continue;
        }

        FileFingerprint after = Fingerprint(*resolved);
        if (!after.exists || after == before) {
            continue;
        }

        auto status = fs::symlink_status(*resolved, ec);
        if (ec || !fs::is_regular_file(status)) {
            spdlog::warn("Skipping declared output '{}': not a regular file", declared);
            continue;
        }

        fs::path canonical = fs::weakly_canonical(*resolved, ec);
        if (ec) {
            spdlog::warn("Skipping declared output '{}': {}", declared, ec.message());
            continue;
        }
        auto rel = canonical.lexically_relative(root);
        if (rel.empty() || *rel.begin() == "..") {
            spdlog::warn("Skipping declared output '{}': resolves outside the workspace", declared);
            continue;
        }

        std::ifstream file(*resolved, std::ios::binary);
        if (!file) {
            spdlog::warn("Skipping declared output '{}': cannot open", declared);
            continue;
        }

        // Allocation follows the file size, capped at the ceiling.
        utils::BoundedOutputBuffer buffer(max_file_bytes);
        std::array<char, 8192> chunk;
        while (!buffer.Truncated()) {
            file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
            std::streamsize got = file.gcount();
            if (got <= 0) {
                break;
            }
            buffer.Append(chunk.data(), static_cast<std::size_t>(got));
        }

        if (buffer.Truncated()) {
            result.truncated_output_files.push_back(declared);
            spdlog::warn("Declared output '{}' truncated at {} bytes", declared, max_file_bytes);
        }

        std::string content = buffer.Release();
        spdlog::debug("Collected declared output '{}' ({} bytes)", declared, content.size());
        result.output_files[declared] = std::move(content);
    }
}

} // namespace core
} // namespace threatweaver
