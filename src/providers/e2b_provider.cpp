/**
 * @file e2b_provider.cpp
 * @brief Implementation of the remote micro-VM backend
 *
 * **Timeout Enforcement**:
 * The process stream is aborted from the transport's abort hook once the
 * tool's deadline passes or the token is cancelled; the sandbox is then
 * killed through the control plane. The sandbox is also created with a
 * service-side lifetime of timeout + grace, which bounds its life if the
 * kill call never arrives.
 *
 * **Failure Mapping**:
 * - capacity, create, upload fail     -> setup failure (execution fault)
 * - deadline passed                   -> timeout fault
 * - "signal: killed" without an abort -> resource fault (VM OOM killer)
 * - stream or agent error             -> backend error (execution fault)
 * - non-zero exitCode                 -> execution fault with stderr excerpt
 *
 * @date 2025
 */

#include "threatweaver/providers/e2b_provider.hpp"
#include "threatweaver/core/output_capture.hpp"
#include "threatweaver/utils/output_buffer.hpp"
#include "threatweaver/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace threatweaver {
namespace providers {

using core::ExecutionLifecycle;
using core::ExecutionState;
using core::IsolationNamespace;
using core::OutputCapture;
using core::RunObservation;
using core::SandboxExecutionResult;
using utils::StringUtils;

namespace {

E2bClientOptions ClientOptions(const core::SandboxConfig& config) {
    E2bClientOptions options;
    options.api_url = config.e2b_api_url;
    options.api_key = config.e2b_api_key;
    options.domain = config.e2b_domain;
    options.user = config.e2b_user;
    options.request_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config.request_timeout);
    options.transfer_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config.transfer_timeout);
    return options;
}

std::string RemotePath(const std::string& relative) {
    return std::string(core::kSandboxWorkspaceDir) + "/" + relative;
}

std::string ReadLocalFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw E2bError("cannot read " + path.string());
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

bool SameFile(const fs::path& a, const fs::path& b) {
    std::error_code ec;
    auto status = fs::symlink_status(b, ec);
    if (ec || !fs::is_regular_file(status)) {
        return false;
    }
    auto size = fs::file_size(a, ec);
    if (ec || fs::file_size(b, ec) != size || ec) {
        return false;
    }

    std::ifstream left(a, std::ios::binary);
    std::ifstream right(b, std::ios::binary);
    std::array<char, 8192> lbuf;
    std::array<char, 8192> rbuf;
    while (left && right) {
        left.read(lbuf.data(), static_cast<std::streamsize>(lbuf.size()));
        right.read(rbuf.data(), static_cast<std::streamsize>(rbuf.size()));
        if (left.gcount() != right.gcount() ||
            !std::equal(lbuf.begin(), lbuf.begin() + left.gcount(), rbuf.begin())) {
            return false;
        }
    }
    return left.eof() && right.eof();
}

std::string DescribeCapacity(const core::E2bTemplateSize& size) {
    std::ostringstream text;
    text << size.cpu << " vCPU / " << size.memory_mb << " MB";
    return text.str();
}

bool IsRegistryReference(const std::string& image) {
    return image.find('/') != std::string::npos || image.find(':') != std::string::npos;
}

bool InsideRoot(const fs::path& root, const fs::path& candidate) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(candidate, ec);
    if (ec) {
        return false;
    }
    auto rel = canonical.lexically_relative(root);
    return !rel.empty() && *rel.begin() != "..";
}

} // anonymous namespace

E2bProvider::E2bProvider(const core::SandboxConfig& config,
                         std::shared_ptr<utils::HttpTransport> transport)
    : config_(config),
      client_(std::move(transport), ClientOptions(config)) {
    spdlog::info("E2B sandbox provider initialized (template: {}, api: {})",
                 config_.e2b_template_id, config_.e2b_api_url);
}

core::E2bTemplateSize E2bProvider::SelectTemplate(const core::ToolInvocationSpec& spec) const {
    auto fits = [&spec](const core::E2bTemplateSize& size) {
        return spec.CpuLimit() <= size.cpu && spec.MemoryLimitMb() <= size.memory_mb;
    };
    std::ostringstream requested;
    requested << spec.CpuLimit() << " vCPU / " << spec.MemoryLimitMb() << " MB";

    core::E2bTemplateSize fallback{config_.e2b_template_id, config_.e2b_template_cpu,
                                   config_.e2b_template_memory_mb};

    const std::string& image = spec.Image();
    if (!image.empty() && !IsRegistryReference(image)) {
        core::E2bTemplateSize chosen{image, fallback.cpu, fallback.memory_mb};
        for (const auto& size : config_.e2b_template_sizes) {
            if (size.template_id == image) {
                chosen = size;
            }
        }
        if (!fits(chosen)) {
            throw E2bError("requested " + requested.str() + " exceeds template capacity of " +
                           DescribeCapacity(chosen));
        }
        return chosen;
    }
    if (!image.empty()) {
        spdlog::debug("Image '{}' is a registry reference; selecting a configured template", image);
    }

    const core::E2bTemplateSize* best = nullptr;
    auto consider = [&](const core::E2bTemplateSize& size) {
        if (!fits(size)) {
            return;
        }
        if (best == nullptr || size.memory_mb < best->memory_mb ||
            (size.memory_mb == best->memory_mb && size.cpu < best->cpu)) {
            best = &size;
        }
    };
    for (const auto& size : config_.e2b_template_sizes) {
        consider(size);
    }
    consider(fallback);

    if (best == nullptr) {
        throw E2bError("requested " + requested.str() + " exceeds template capacity of " +
                       DescribeCapacity(fallback));
    }
    return *best;
}

// ============================================================================
// EXECUTION
// ============================================================================

SandboxExecutionResult E2bProvider::Execute(const core::ToolInvocationSpec& spec,
                                            const fs::path& workspace_dir,
                                            const std::string& scan_id,
                                            const utils::CancellationToken& cancel_token) {
    SandboxExecutionResult result;
    std::string slug;
    std::string sandbox_id;

    try {
        RunInSandbox(spec, workspace_dir, scan_id, cancel_token, result, slug, sandbox_id);
    } catch (const std::exception& e) {
        spdlog::error("E2B execution of '{}' for scan {} failed: {}", spec.Name(), scan_id, e.what());
        result.success = false;
        result.exit_code = core::kNoExitCode;
        result.error = core::SandboxError{core::ErrorKind::kExecution,
                                          std::string("internal error: ") + e.what()};
        result.outcome = ExecutionState::FAILED;
        if (!sandbox_id.empty()) {
            TeardownSandbox(slug, sandbox_id, result);
        }
    }

    return result;
}

void E2bProvider::RunInSandbox(const core::ToolInvocationSpec& spec,
                               const fs::path& workspace_dir,
                               const std::string& scan_id,
                               const utils::CancellationToken& cancel_token,
                               SandboxExecutionResult& result,
                               std::string& slug,
                               std::string& sandbox_id) {
    ExecutionLifecycle lifecycle;
    RunObservation observation;
    core::OutputSnapshot snapshot;
    fs::path workspace;
    E2bSandbox sandbox;

    lifecycle.TransitionTo(ExecutionState::PROVISIONING);
    spdlog::info("Provisioning E2B sandbox for '{}' (scan {})", spec.Name(), scan_id);

    // ---- Provisioning ------------------------------------------------------
    try {
        IsolationNamespace ns(scan_id, config_.resource_prefix);
        slug = ns.Slug();

        std::error_code ec;
        if (!fs::is_directory(workspace_dir, ec)) {
            throw E2bError("workspace is not a directory: " + workspace_dir.string());
        }
        workspace = fs::absolute(workspace_dir);

        core::E2bTemplateSize size = SelectTemplate(spec);
        observation.enforced_memory_mb = size.memory_mb;
        snapshot = OutputCapture::Snapshot(workspace, spec.DeclaredOutputs());

        if (cancel_token.IsCancelled()) {
            throw E2bError("cancelled before start");
        }

        CreateSandboxRequest create;
        create.template_id = size.template_id;
        create.timeout = spec.Timeout() + config_.e2b_timeout_grace;
        create.metadata = {
            {ns.MetadataKey(), ns.Slug()},
            {ns.ResourcePrefix() + "_tool", spec.Name()}
        };
        create.allow_internet_access = !spec.BlockEgress();

        sandbox = client_.CreateSandbox(create);
        sandbox_id = sandbox.sandbox_id;
        result.sandbox_id = sandbox_id;
        Register(slug, sandbox_id);
        spdlog::debug("Sandbox {} created for scan {} from template {} ({})",
                      sandbox_id, scan_id, size.template_id, DescribeCapacity(size));

        client_.MakeDir(sandbox, core::kSandboxWorkspaceDir);
        UploadWorkspace(sandbox, workspace, cancel_token);

        // Tools expect the parent directory of their output to exist.
        for (const auto& declared : spec.DeclaredOutputs()) {
            std::string rel = OutputCapture::RelativeDeclaredPath(declared);
            auto parent = fs::path(rel).parent_path();
            if (!rel.empty() && !parent.empty()) {
                client_.MakeDir(sandbox, RemotePath(parent.generic_string()));
            }
        }

        if (cancel_token.IsCancelled()) {
            throw E2bError("cancelled before start");
        }
        observation.provisioned = true;
    } catch (const E2bError& e) {
        observation.setup_error = cancel_token.IsCancelled() ? "cancelled before start" : e.what();
    } catch (const std::invalid_argument& e) {
        observation.setup_error = e.what();
    }

    if (!observation.provisioned) {
        spdlog::error("Provisioning '{}' for scan {} failed: {}",
                      spec.Name(), scan_id, observation.setup_error);
        lifecycle.TransitionTo(core::ClassifyOutcome(observation, spec, result));
        if (!sandbox_id.empty()) {
            TeardownSandbox(slug, sandbox_id, result);
        }
        lifecycle.TransitionTo(ExecutionState::CLEANED_UP);
        return;
    }

    // ---- Running -----------------------------------------------------------
    lifecycle.TransitionTo(ExecutionState::RUNNING);
    spdlog::info("Running '{}' in sandbox {}", spec.Name(), sandbox_id);

    ProcessRequest process;
    process.cmd = spec.Command();
    process.args = spec.Args();
    process.envs = spec.Env();
    process.cwd = core::kSandboxWorkspaceDir;

    utils::BoundedOutputBuffer out(config_.max_output_bytes);
    utils::BoundedOutputBuffer err(config_.max_output_bytes);
    std::atomic<bool> timed_out{false};
    std::atomic<bool> cancelled{false};

    auto start = std::chrono::steady_clock::now();
    auto deadline = start + spec.Timeout();

    ProcessOutcome run = client_.RunProcess(
        sandbox, process,
        [&out, &err](bool is_stderr, const std::string& data) {
            (is_stderr ? err : out).Append(data);
        },
        [&]() {
            if (cancel_token.IsCancelled()) {
                cancelled = true;
                return true;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                timed_out = true;
                return true;
            }
            return false;
        });

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    result.stdout_truncated = out.Truncated();
    result.stderr_truncated = err.Truncated();
    result.stdout_output = out.Release();
    result.stderr_output = err.Release();

    if (run.aborted) {
        observation.timed_out = timed_out.load();
        observation.cancelled = cancelled.load();
        spdlog::warn("'{}' {}; killing sandbox {}", spec.Name(),
                     observation.timed_out ? "timed out" : "was cancelled", sandbox_id);
    } else if (!run.transport_error.empty()) {
        observation.backend_error = run.transport_error;
    } else if (!run.ended) {
        observation.backend_error = run.error.empty()
            ? "process stream ended without an exit status"
            : run.error;
    } else if (!run.exited && StringUtils::Contains(run.status, "signal: killed")) {
        observation.resource_killed = true;
        observation.resource_detail = run.status;
    } else if (!run.error.empty()) {
        observation.exit_code = run.exit_code;
        observation.backend_error = run.error;
    } else {
        observation.exit_code = run.exit_code;
    }

    ExecutionState outcome = core::ClassifyOutcome(observation, spec, result);

    if (outcome != ExecutionState::TIMED_OUT && !observation.cancelled) {
        try {
            DownloadOutputs(sandbox, spec, workspace, cancel_token);
        } catch (const E2bError& e) {
            spdlog::warn("Downloading outputs of '{}' failed: {}", spec.Name(), e.what());
        }
        OutputCapture::Collect(snapshot, config_.max_output_file_bytes, result);
    }
    lifecycle.TransitionTo(outcome);

    if (result.success) {
        spdlog::info("'{}' succeeded in {}ms", spec.Name(), result.duration.count());
    } else {
        spdlog::error("'{}' failed ({}): {}", spec.Name(),
                      core::ErrorKindToString(result.error->kind), result.error->message);
    }

    // ---- Teardown ----------------------------------------------------------
    TeardownSandbox(slug, sandbox_id, result);
    lifecycle.TransitionTo(ExecutionState::CLEANED_UP);
}

void E2bProvider::TeardownSandbox(const std::string& slug, std::string& sandbox_id,
                                  SandboxExecutionResult& result) {
    try {
        if (!client_.KillSandbox(sandbox_id)) {
            spdlog::debug("Sandbox {} was already gone", sandbox_id);
        }
        Unregister(slug, sandbox_id);
    } catch (const E2bError& e) {
        // Stays registered so Cleanup() retries it.
        std::string message = "kill " + sandbox_id + ": " + e.what();
        spdlog::warn("Sandbox teardown failed: {}", message);
        result.teardown_errors.push_back(message);
    }
    sandbox_id.clear();
}

// ============================================================================
// WORKSPACE TRANSFER
// ============================================================================

void E2bProvider::UploadWorkspace(const E2bSandbox& sandbox, const fs::path& workspace,
                                  const utils::CancellationToken& cancel_token) {
    std::size_t total = 0;
    std::size_t files = 0;
    std::error_code ec;

    fs::recursive_directory_iterator it(workspace, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw E2bError("cannot scan workspace " + workspace.string() + ": " + ec.message());
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw E2bError("cannot scan workspace " + workspace.string() + ": " + ec.message());
        }
        if (cancel_token.IsCancelled()) {
            throw E2bError("upload cancelled");
        }

        const fs::path& path = it->path();
        std::string rel = path.lexically_relative(workspace).generic_string();
        auto status = it->symlink_status(ec);
        if (ec) {
            throw E2bError("cannot stat " + path.string() + ": " + ec.message());
        }

        if (fs::is_symlink(status)) {
            spdlog::debug("Not uploading symlink {}", rel);
            continue;
        }
        if (fs::is_directory(status)) {
            client_.MakeDir(sandbox, RemotePath(rel));
            continue;
        }
        if (!fs::is_regular_file(status)) {
            continue;
        }

        std::string content = ReadLocalFile(path);
        total += content.size();
        if (total > config_.max_upload_bytes) {
            throw E2bError("workspace exceeds upload limit of " +
                           std::to_string(config_.max_upload_bytes) + " bytes");
        }
        client_.WriteFile(sandbox, RemotePath(rel), content,
                          [&cancel_token]() { return cancel_token.IsCancelled(); });
        ++files;
    }

    spdlog::debug("Uploaded {} file(s), {} bytes to sandbox {}", files, total, sandbox.sandbox_id);
}

void E2bProvider::DownloadOutputs(const E2bSandbox& sandbox,
                                  const core::ToolInvocationSpec& spec,
                                  const fs::path& workspace,
                                  const utils::CancellationToken& cancel_token) {
    std::error_code ec;
    fs::path root = fs::weakly_canonical(workspace, ec);
    if (ec) {
        throw E2bError("cannot resolve workspace " + workspace.string() + ": " + ec.message());
    }

    for (const auto& declared : spec.DeclaredOutputs()) {
        if (cancel_token.IsCancelled()) {
            throw E2bError("download cancelled");
        }
        std::string rel = OutputCapture::RelativeDeclaredPath(declared);
        if (rel.empty()) {
            continue;
        }

        fs::path local = workspace / rel;
        if (fs::is_symlink(fs::symlink_status(local, ec))) {
            spdlog::warn("Not writing declared output '{}': local path is a symlink", declared);
            continue;
        }
        fs::create_directories(local.parent_path(), ec);
        if (ec || !InsideRoot(root, local.parent_path())) {
            spdlog::warn("Not writing declared output '{}': parent directory unusable", declared);
            continue;
        }

        // Streamed next to the target and renamed over it once complete.
        fs::path staging = local.parent_path() / ("." + local.filename().string() + ".threatweaver-part");
        std::ofstream file(staging, std::ios::binary | std::ios::trunc);
        if (!file) {
            spdlog::warn("Not writing declared output '{}': cannot create {}", declared, staging.string());
            continue;
        }

        std::size_t written = 0;
        bool oversized = false;
        bool write_failed = false;
        bool found = false;
        try {
            found = client_.DownloadFile(
                sandbox, RemotePath(rel),
                [&](const char* data, std::size_t length) {
                    written += length;
                    if (written > config_.max_upload_bytes) {
                        oversized = true;
                        return false;
                    }
                    file.write(data, static_cast<std::streamsize>(length));
                    write_failed = !file;
                    return !write_failed;
                },
                [&cancel_token]() { return cancel_token.IsCancelled(); });
        } catch (const E2bError& e) {
            file.close();
            fs::remove(staging, ec);
            if (oversized) {
                spdlog::warn("Not writing declared output '{}': larger than {} bytes",
                             declared, config_.max_upload_bytes);
                continue;
            }
            if (write_failed) {
                spdlog::warn("Writing declared output '{}' to {} failed: {}",
                             declared, staging.string(), e.what());
                continue;
            }
            throw;
        }

        file.close();
        if (!found || !file) {
            fs::remove(staging, ec);
            if (found) {
                spdlog::warn("Writing declared output '{}' to {} failed", declared, local.string());
            }
            continue;
        }

        if (SameFile(staging, local)) {
            fs::remove(staging, ec);
            continue;
        }
        fs::rename(staging, local, ec);
        if (ec) {
            spdlog::warn("Writing declared output '{}' to {} failed: {}", declared, local.string(), ec.message());
            fs::remove(staging, ec);
            continue;
        }
        spdlog::debug("Downloaded declared output '{}' ({} bytes)", declared, written);
    }
}

// ============================================================================
// REGISTRY
// ============================================================================

void E2bProvider::Register(const std::string& slug, const std::string& sandbox_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    active_[slug].insert(sandbox_id);
}

void E2bProvider::Unregister(const std::string& slug, const std::string& sandbox_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = active_.find(slug);
    if (it == active_.end()) {
        return;
    }
    it->second.erase(sandbox_id);
    if (it->second.empty()) {
        active_.erase(it);
    }
}

std::vector<std::string> E2bProvider::TakeRegistered(const std::string& slug) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::vector<std::string> ids;
    auto it = active_.find(slug);
    if (it != active_.end()) {
        ids.assign(it->second.begin(), it->second.end());
        active_.erase(it);
    }
    return ids;
}

std::size_t E2bProvider::ActiveSandboxCount(const std::string& scan_id) const {
    IsolationNamespace ns(scan_id, config_.resource_prefix);
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = active_.find(ns.Slug());
    return it == active_.end() ? 0 : it->second.size();
}

// ============================================================================
// CLEANUP AND HEALTH
// ============================================================================

core::CleanupReport E2bProvider::Cleanup(const std::string& scan_id) {
    core::CleanupReport report;
    report.scan_id = scan_id;

    try {
        IsolationNamespace ns(scan_id, config_.resource_prefix);
        spdlog::info("Cleaning up E2B sandboxes for scan {}", scan_id);

        std::set<std::string> ids;
        for (const auto& id : TakeRegistered(ns.Slug())) {
            ids.insert(id);
        }
        try {
            for (const auto& id : client_.ListSandboxes({{ns.MetadataKey(), ns.Slug()}})) {
                ids.insert(id);
            }
        } catch (const E2bError& e) {
            report.failures.push_back(e.what());
        }

        for (const auto& id : ids) {
            try {
                if (client_.KillSandbox(id)) {
                    ++report.released;
                }
            } catch (const E2bError& e) {
                report.failures.push_back("kill " + id + ": " + e.what());
                Register(ns.Slug(), id);
            }
        }
    } catch (const std::exception& e) {
        report.failures.push_back(std::string("cleanup failed: ") + e.what());
    }

    for (const auto& failure : report.failures) {
        spdlog::warn("Cleanup of scan {}: {}", scan_id, failure);
    }
    spdlog::info("Scan {} cleanup released {} sandbox(es)", scan_id, report.released);
    return report;
}

bool E2bProvider::HealthCheck() {
    long status = client_.ProbeControlPlane(
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.health_check_timeout));

    if (status == 200) {
        return true;
    }
    if (status == 401 || status == 403) {
        spdlog::warn("E2B control plane rejected the API key (HTTP {})", status);
        return false;
    }
    if (status == 0) {
        spdlog::warn("E2B control plane is not reachable");
    } else {
        spdlog::warn("E2B control plane answered HTTP {}", status);
    }
    return false;
}

} // namespace providers
} // namespace threatweaver
