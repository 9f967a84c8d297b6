/**
 * @file docker_provider.cpp
 * @brief Implementation of the local container backend
 *
 * **Timeout Enforcement**:
 * The attached `docker start -a` client runs under the tool's deadline.
 * When it is killed for timeout or cancellation the container itself is
 * still alive, so it is killed explicitly before removal.
 *
 * **Failure Mapping**:
 * - create fails          -> setup failure (execution fault)
 * - attach deadline       -> timeout fault
 * - State.OOMKilled       -> resource fault
 * - State.Error non-empty -> backend error (execution fault)
 * - non-zero ExitCode     -> execution fault with stderr excerpt
 *
 * @date 2025
 */

#include "threatweaver/providers/docker_provider.hpp"
#include "threatweaver/core/output_capture.hpp"
#include "threatweaver/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

namespace fs = std::filesystem;

namespace threatweaver {
namespace providers {

using core::ExecutionLifecycle;
using core::ExecutionState;
using core::IsolationNamespace;
using core::OutputCapture;
using core::RunObservation;
using core::SandboxExecutionResult;

namespace {

utils::ContainerRuntimeOptions RuntimeOptions(const core::SandboxConfig& config) {
    utils::ContainerRuntimeOptions options;
    options.binary = config.docker_binary;
    options.docker_host = config.docker_host;
    options.command_timeout = config.request_timeout;
    return options;
}

} // anonymous namespace

DockerProvider::DockerProvider(const core::SandboxConfig& config,
                               std::shared_ptr<utils::ProcessRunner> runner)
    : config_(config),
      docker_(std::move(runner), RuntimeOptions(config)) {
    spdlog::info("Docker sandbox provider initialized (default image: {})", config_.docker_image);
}

// ============================================================================
// EXECUTION
// ============================================================================

SandboxExecutionResult DockerProvider::Execute(const core::ToolInvocationSpec& spec,
                                               const fs::path& workspace_dir,
                                               const std::string& scan_id,
                                               const utils::CancellationToken& cancel_token) {
    SandboxExecutionResult result;
    std::string container_id;

    try {
        RunInContainer(spec, workspace_dir, scan_id, cancel_token, result, container_id);
    } catch (const std::exception& e) {
        spdlog::error("Docker execution of '{}' for scan {} failed: {}", spec.Name(), scan_id, e.what());
        result.success = false;
        result.exit_code = core::kNoExitCode;
        result.error = core::SandboxError{core::ErrorKind::kExecution,
                                          std::string("internal error: ") + e.what()};
        result.outcome = ExecutionState::FAILED;
        if (!container_id.empty()) {
            TeardownContainer(container_id, result);
        }
    }

    return result;
}

void DockerProvider::RunInContainer(const core::ToolInvocationSpec& spec,
                                    const fs::path& workspace_dir,
                                    const std::string& scan_id,
                                    const utils::CancellationToken& cancel_token,
                                    SandboxExecutionResult& result,
                                    std::string& container_id) {
    ExecutionLifecycle lifecycle;
    RunObservation observation;
    core::OutputSnapshot snapshot;

    lifecycle.TransitionTo(ExecutionState::PROVISIONING);
    spdlog::info("Provisioning container for '{}' (scan {})", spec.Name(), scan_id);

    // ---- Provisioning ------------------------------------------------------
    try {
        IsolationNamespace ns(scan_id, config_.resource_prefix);

        std::error_code ec;
        if (!fs::is_directory(workspace_dir, ec)) {
            throw utils::ContainerError("workspace is not a directory: " + workspace_dir.string());
        }
        fs::path workspace = fs::absolute(workspace_dir);

        snapshot = OutputCapture::Snapshot(workspace, spec.DeclaredOutputs());

        std::string network = PrepareNetwork(spec, ns);
        auto container_config = BuildContainerConfig(spec, workspace, ns, network);

        if (cancel_token.IsCancelled()) {
            throw utils::ContainerError("cancelled before start");
        }

        container_id = docker_.CreateContainer(container_config);
        result.sandbox_id = container_id;
        observation.provisioned = true;
    } catch (const utils::ContainerError& e) {
        observation.setup_error = e.what();
    } catch (const std::invalid_argument& e) {
        observation.setup_error = e.what();
    }

    if (!observation.provisioned) {
        spdlog::error("Provisioning '{}' for scan {} failed: {}",
                      spec.Name(), scan_id, observation.setup_error);
        lifecycle.TransitionTo(core::ClassifyOutcome(observation, spec, result));
        lifecycle.TransitionTo(ExecutionState::CLEANED_UP);
        return;
    }

    // ---- Running -----------------------------------------------------------
    lifecycle.TransitionTo(ExecutionState::RUNNING);
    spdlog::info("Running '{}' in container {}", spec.Name(), container_id.substr(0, 12));

    auto start = std::chrono::steady_clock::now();
    auto run = docker_.StartAttached(container_id,
                                     std::chrono::duration_cast<std::chrono::milliseconds>(spec.Timeout()),
                                     cancel_token, config_.max_output_bytes);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    result.stdout_output = std::move(run.stdout_output);
    result.stderr_output = std::move(run.stderr_output);
    result.stdout_truncated = run.stdout_truncated;
    result.stderr_truncated = run.stderr_truncated;
    observation.timed_out = run.timed_out;
    observation.cancelled = run.cancelled;

    if (run.timed_out || run.cancelled) {
        spdlog::warn("'{}' {}; killing container {}", spec.Name(),
                     run.timed_out ? "timed out" : "was cancelled", container_id.substr(0, 12));
        auto kill = docker_.KillContainer(container_id);
        if (!kill.success) {
            result.teardown_errors.push_back("kill " + container_id + ": " + kill.Describe());
        }
    } else {
        try {
            auto state = docker_.InspectState(container_id);
            if (state.oom_killed) {
                observation.resource_killed = true;
                observation.resource_detail = "OOMKilled";
            } else if (state.running) {
                observation.backend_error = "container still running after attach ended";
                auto kill = docker_.KillContainer(container_id);
                if (!kill.success) {
                    result.teardown_errors.push_back("kill " + container_id + ": " + kill.Describe());
                }
            } else if (!state.error.empty()) {
                observation.exit_code = state.exit_code;
                observation.backend_error = state.error;
            } else {
                observation.exit_code = state.exit_code;
            }
        } catch (const utils::ContainerError& e) {
            observation.backend_error = e.what();
            observation.exit_code = run.exit_code;
        }
    }

    ExecutionState outcome = core::ClassifyOutcome(observation, spec, result);

    if (outcome != ExecutionState::TIMED_OUT) {
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
    TeardownContainer(container_id, result);
    lifecycle.TransitionTo(ExecutionState::CLEANED_UP);
}

void DockerProvider::TeardownContainer(std::string& container_id, SandboxExecutionResult& result) {
    auto removed = docker_.RemoveContainer(container_id);
    if (!removed.success) {
        std::string message = "rm " + container_id + ": " + removed.Describe();
        spdlog::warn("Container removal failed: {}", message);
        result.teardown_errors.push_back(message);
    }
    container_id.clear();
}

// ============================================================================
// CONTAINER CONFIGURATION
// ============================================================================

std::string DockerProvider::PrepareNetwork(const core::ToolInvocationSpec& spec,
                                           const IsolationNamespace& ns) {
    if (spec.BlockEgress()) {
        return "none";
    }
    if (!spec.NetworkIsolated()) {
        return "bridge";
    }

    std::string name = ns.NetworkName();
    auto created = docker_.CreateNetwork(name, {{ns.LabelKey(), ns.Slug()}});
    if (!created.success) {
        throw utils::ContainerError("network create " + name + ": " + created.Describe());
    }
    return name;
}

utils::ContainerConfig DockerProvider::BuildContainerConfig(const core::ToolInvocationSpec& spec,
                                                            const fs::path& workspace,
                                                            const IsolationNamespace& ns,
                                                            const std::string& network) const {
    utils::ContainerConfig config;
    config.name = ns.ResourceName("run") + "-" + utils::HashUtils::RandomHex(4);
    config.image = spec.Image().empty() ? config_.docker_image : spec.Image();
    config.labels = {
        {ns.LabelKey(), ns.Slug()},
        {ns.ResourcePrefix() + ".tool", spec.Name()}
    };

    config.cpu_limit = spec.CpuLimit();
    config.memory_limit_mb = spec.MemoryLimitMb();
    config.pids_limit = config_.pids_limit;
    config.network = network;

    config.user = ContainerUser();
    config.mounts.push_back(utils::VolumeMount{workspace.string(), core::kSandboxWorkspaceDir, false});
    config.working_dir = core::kSandboxWorkspaceDir;
    config.environment_vars = spec.Env();

    config.entrypoint = spec.Command();
    config.command = spec.Args();
    return config;
}

std::string DockerProvider::ContainerUser() const {
    if (!config_.container_user.empty()) {
        return config_.container_user;
    }
    return std::to_string(::getuid()) + ":" + std::to_string(::getgid());
}

// ============================================================================
// CLEANUP AND HEALTH
// ============================================================================

core::CleanupReport DockerProvider::Cleanup(const std::string& scan_id) {
    core::CleanupReport report;
    report.scan_id = scan_id;

    try {
        IsolationNamespace ns(scan_id, config_.resource_prefix);
        spdlog::info("Cleaning up Docker resources for scan {}", scan_id);

        try {
            for (const auto& id : docker_.ListContainers(ns.LabelSelector())) {
                auto removed = docker_.RemoveContainer(id);
                if (removed.success) {
                    ++report.released;
                } else {
                    report.failures.push_back("rm " + id + ": " + removed.Describe());
                }
            }
        } catch (const utils::ContainerError& e) {
            report.failures.push_back(e.what());
        }

        try {
            for (const auto& name : docker_.ListNetworks(ns.LabelSelector())) {
                auto removed = docker_.RemoveNetwork(name);
                if (removed.success) {
                    ++report.released;
                } else {
                    report.failures.push_back("network rm " + name + ": " + removed.Describe());
                }
            }
        } catch (const utils::ContainerError& e) {
            report.failures.push_back(e.what());
        }
    } catch (const std::exception& e) {
        report.failures.push_back(std::string("cleanup failed: ") + e.what());
    }

    for (const auto& failure : report.failures) {
        spdlog::warn("Cleanup of scan {}: {}", scan_id, failure);
    }
    spdlog::info("Scan {} cleanup released {} resource(s)", scan_id, report.released);
    return report;
}

bool DockerProvider::HealthCheck() {
    try {
        auto version = docker_.GetServerVersion(config_.health_check_timeout);
        if (!version) {
            spdlog::warn("Docker daemon is not reachable");
            return false;
        }
        spdlog::debug("Docker daemon version {}", *version);
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Docker health check failed: {}", e.what());
        return false;
    }
}

} // namespace providers
} // namespace threatweaver
