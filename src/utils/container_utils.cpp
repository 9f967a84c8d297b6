/**
 * @file container_utils.cpp
 * @brief Implementation of the Docker CLI wrapper
 *
 * **Hardening Flags** (applied by BuildCreateCommand):
 * 1. Capability dropping: --cap-drop ALL
 * 2. No new privileges: --security-opt no-new-privileges
 * 3. Read-only rootfs with a /tmp tmpfs
 * 4. Resource ceilings: --cpus, --memory, --memory-swap (= memory), --pids-limit
 * 5. Network: none, default bridge, or a per-scan user-defined network
 * 6. Unprivileged user: --user uid:gid
 *
 * **Container Lifecycle**:
 * ```
 * create -> start -a -> inspect -> (kill) -> rm -f
 * ```
 *
 * @date 2025
 */

#include "threatweaver/utils/container_utils.hpp"
#include "threatweaver/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <sstream>

using json = nlohmann::json;

namespace threatweaver {
namespace utils {

namespace {

std::string FormatCpus(double cpus) {
    std::ostringstream out;
    out << cpus;
    return out.str();
}

} // anonymous namespace

std::string ContainerExecResult::Describe() const {
    if (timed_out) {
        return "timed out after " + std::to_string(duration.count()) + "ms";
    }
    if (cancelled) {
        return "cancelled";
    }
    std::string text = StringUtils::Trim(StringUtils::Tail(stderr_output, 300));
    if (text.empty()) {
        text = StringUtils::Trim(StringUtils::Tail(stdout_output, 300));
    }
    return "exit " + std::to_string(exit_code) + (text.empty() ? "" : ": " + StringUtils::Sanitize(text));
}

// ============================================================================
// CONSTRUCTOR / RUNTIME DETECTION
// ============================================================================

ContainerUtils::ContainerUtils(std::shared_ptr<ProcessRunner> runner, ContainerRuntimeOptions options)
    : runner_(std::move(runner)), options_(std::move(options)) {
    if (!runner_) {
        throw std::invalid_argument("ContainerUtils requires a process runner");
    }
}

bool ContainerUtils::IsRuntimeAvailable(const std::string& binary) {
    return !PosixProcessRunner::FindExecutable(binary).empty();
}

std::optional<std::string> ContainerUtils::GetServerVersion(std::chrono::seconds timeout) {
    ProcessOptions process_options = ControlOptions();
    process_options.timeout = timeout;

    auto result = ExecuteDockerCommand({"version", "--format", "{{.Server.Version}}"}, process_options);
    if (!result.success) {
        spdlog::debug("Docker daemon not reachable: {}", result.Describe());
        return std::nullopt;
    }

    std::string version = StringUtils::Trim(result.stdout_output);
    if (version.empty()) {
        return std::nullopt;
    }
    return version;
}

// ============================================================================
// NETWORK MANAGEMENT
// ============================================================================

ContainerExecResult ContainerUtils::CreateNetwork(const std::string& name,
                                                  const std::map<std::string, std::string>& labels) {
    std::vector<std::string> args{"network", "create", "--driver", "bridge"};
    for (const auto& [key, value] : labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }
    args.push_back(name);

    auto result = ExecuteDockerCommand(args);
    if (!result.success && StringUtils::Contains(result.stderr_output, "already exists")) {
        spdlog::debug("Network {} already exists", name);
        result.success = true;
    }
    return result;
}

ContainerExecResult ContainerUtils::RemoveNetwork(const std::string& name) {
    auto result = ExecuteDockerCommand({"network", "rm", name});
    if (!result.success && IsNotFound(result.stderr_output)) {
        result.success = true;
    }
    return result;
}

std::vector<std::string> ContainerUtils::ListNetworks(const std::string& label_filter) {
    auto result = ExecuteDockerCommand(
        {"network", "ls", "--filter", "label=" + label_filter, "--format", "{{.Name}}"});
    if (!result.success) {
        throw ContainerError("network ls failed: " + result.Describe());
    }
    return SplitLines(result.stdout_output);
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

std::string ContainerUtils::CreateContainer(const ContainerConfig& config) {
    if (config.image.empty()) {
        throw ContainerError("container image must not be empty");
    }

    auto args = BuildCreateCommand(config);
    spdlog::debug("Creating container {} from {}", config.name, config.image);

    auto result = ExecuteDockerCommand(args);
    if (!result.success) {
        throw ContainerError("create failed: " + result.Describe());
    }

    std::string container_id = StringUtils::Trim(result.stdout_output);
    if (container_id.empty()) {
        throw ContainerError("create returned no container id");
    }
    return container_id;
}

ContainerExecResult ContainerUtils::StartAttached(const std::string& container_id,
                                                  std::chrono::milliseconds timeout,
                                                  const CancellationToken& cancel_token,
                                                  std::size_t max_output_bytes) {
    ProcessOptions process_options = ControlOptions();
    process_options.timeout = timeout;
    process_options.cancel_token = cancel_token;
    process_options.max_output_bytes = max_output_bytes;

    return ExecuteDockerCommand({"start", "-a", container_id}, process_options);
}

ContainerExitState ContainerUtils::InspectState(const std::string& container_id) {
    auto result = ExecuteDockerCommand({"inspect", "--format", "{{json .State}}", container_id});
    if (!result.success) {
        throw ContainerError("inspect failed: " + result.Describe());
    }
    return ParseStateOutput(result.stdout_output);
}

ContainerExecResult ContainerUtils::KillContainer(const std::string& container_id) {
    auto result = ExecuteDockerCommand({"kill", container_id});
    if (!result.success && (IsNotFound(result.stderr_output) ||
                            StringUtils::Contains(result.stderr_output, "is not running"))) {
        result.success = true;
    }
    return result;
}

ContainerExecResult ContainerUtils::RemoveContainer(const std::string& container_id) {
    auto result = ExecuteDockerCommand({"rm", "-f", "-v", container_id});
    if (!result.success && IsNotFound(result.stderr_output)) {
        result.success = true;
    }
    return result;
}

std::vector<std::string> ContainerUtils::ListContainers(const std::string& label_filter) {
    auto result = ExecuteDockerCommand({"ps", "-aq", "--filter", "label=" + label_filter});
    if (!result.success) {
        throw ContainerError("ps failed: " + result.Describe());
    }
    return SplitLines(result.stdout_output);
}

// ============================================================================
// COMMAND CONSTRUCTION AND PARSING
// ============================================================================

std::vector<std::string> ContainerUtils::BuildCreateCommand(const ContainerConfig& config) {
    std::vector<std::string> args;

    args.push_back("create");

    // Container name
    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    for (const auto& [key, value] : config.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    // CPU limit
    if (config.cpu_limit > 0) {
        args.push_back("--cpus");
        args.push_back(FormatCpus(config.cpu_limit));
    }

    // Memory limit; equal swap limit means no swap on top
    if (config.memory_limit_mb > 0) {
        std::string memory = std::to_string(config.memory_limit_mb) + "m";
        args.push_back("--memory");
        args.push_back(memory);
        args.push_back("--memory-swap");
        args.push_back(memory);
    }

    // Process limit
    if (config.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(config.pids_limit));
    }

    // Network
    args.push_back("--network");
    args.push_back(config.network.empty() ? "none" : config.network);

    // Security: Drop capabilities
    for (const auto& cap : config.capabilities_drop) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }

    if (config.no_new_privileges) {
        args.push_back("--security-opt");
        args.push_back("no-new-privileges");
    }

    // Read-only root filesystem
    if (config.read_only_rootfs) {
        args.push_back("--read-only");
    }

    for (const auto& mount : config.tmpfs) {
        args.push_back("--tmpfs");
        args.push_back(mount);
    }

    // User
    if (!config.user.empty()) {
        args.push_back("--user");
        args.push_back(config.user);
    }

    // Volume mounts
    for (const auto& mount : config.mounts) {
        args.push_back("-v");
        args.push_back(mount.host_path + ":" + mount.container_path + (mount.read_only ? ":ro" : ":rw"));
    }

    // Working directory
    if (!config.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(config.working_dir);
    }

    // Environment variables
    for (const auto& [key, value] : config.environment_vars) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    if (!config.entrypoint.empty()) {
        args.push_back("--entrypoint");
        args.push_back(config.entrypoint);
    }

    // Image, then the arguments passed to the entrypoint
    args.push_back(config.image);
    args.insert(args.end(), config.command.begin(), config.command.end());

    return args;
}

ContainerExitState ContainerUtils::ParseStateOutput(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw ContainerError(std::string("malformed inspect output: ") + e.what());
    }

    // Docker inspect without --format returns an array of full objects
    if (j.is_array() && !j.empty()) {
        j = j[0];
    }
    if (j.is_object() && j.contains("State")) {
        j = j["State"];
    }
    if (!j.is_object()) {
        throw ContainerError("unexpected inspect output");
    }

    ContainerExitState state;
    try {
        state.status = j.value("Status", "");
        state.running = j.value("Running", false);
        state.oom_killed = j.value("OOMKilled", false);
        state.exit_code = j.value("ExitCode", -1);
        state.error = j.value("Error", "");
    } catch (const json::type_error& e) {
        throw ContainerError(std::string("unexpected inspect field type: ") + e.what());
    }
    return state;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

ProcessOptions ContainerUtils::ControlOptions() const {
    ProcessOptions process_options;
    process_options.timeout = options_.command_timeout;
    process_options.max_output_bytes = options_.control_output_bytes;
    if (!options_.docker_host.empty()) {
        process_options.environment["DOCKER_HOST"] = options_.docker_host;
    }
    return process_options;
}

ContainerExecResult ContainerUtils::ExecuteDockerCommand(const std::vector<std::string>& args) const {
    return ExecuteDockerCommand(args, ControlOptions());
}

ContainerExecResult ContainerUtils::ExecuteDockerCommand(const std::vector<std::string>& args,
                                                         const ProcessOptions& process_options) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(options_.binary);
    argv.insert(argv.end(), args.begin(), args.end());

    spdlog::debug("Executing: {}", StringUtils::Join(argv, " "));

    ProcessResult process = runner_->Run(argv, process_options);

    ContainerExecResult exec_result;
    exec_result.exit_code = process.exit_code;
    exec_result.stdout_output = std::move(process.stdout_output);
    exec_result.stderr_output = std::move(process.stderr_output);
    exec_result.stdout_truncated = process.stdout_truncated;
    exec_result.stderr_truncated = process.stderr_truncated;
    exec_result.timed_out = process.timed_out;
    exec_result.cancelled = process.cancelled;
    exec_result.duration = process.duration;
    exec_result.success = process.Succeeded();

    if (process.spawn_failed) {
        exec_result.stderr_output = process.spawn_error;
    }

    return exec_result;
}

std::vector<std::string> ContainerUtils::SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    for (const auto& line : StringUtils::Split(text, '\n')) {
        std::string trimmed = StringUtils::Trim(line);
        if (!trimmed.empty()) {
            lines.push_back(trimmed);
        }
    }
    return lines;
}

bool ContainerUtils::IsNotFound(const std::string& stderr_text) {
    return StringUtils::Contains(stderr_text, "No such") ||
           StringUtils::Contains(stderr_text, "not found");
}

} // namespace utils
} // namespace threatweaver
