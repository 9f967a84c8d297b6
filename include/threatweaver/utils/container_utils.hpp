/**
 * @file container_utils.hpp
 * @brief Docker CLI wrapper for container and network lifecycle
 *
 * Drives the container runtime through its command-line client. Every call
 * is a literal argument vector handed to a ProcessRunner, so container
 * names, images and tool arguments are never interpreted by a shell.
 *
 * @date 2025
 */

#pragma once

#include "threatweaver/utils/cancellation_token.hpp"
#include "threatweaver/utils/process_runner.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace threatweaver {
namespace utils {

/**
 * @class ContainerError
 * @brief A runtime call failed in a way that leaves no usable result
 */
class ContainerError : public std::runtime_error {
public:
    explicit ContainerError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @struct VolumeMount
 * @brief Bind mount from host into the container
 */
struct VolumeMount {
    std::string host_path;
    std::string container_path;
    bool read_only{false};
};

/**
 * @struct ContainerConfig
 * @brief Complete container configuration
 */
struct ContainerConfig {
    // Basic Settings
    std::string name;                              ///< Container name
    std::string image;                             ///< Image reference
    std::map<std::string, std::string> labels;     ///< Labels used for cleanup lookups

    // Resource Limits
    double cpu_limit{2.0};                         ///< --cpus
    std::size_t memory_limit_mb{4096};             ///< --memory, also --memory-swap (no swap)
    int pids_limit{512};                           ///< --pids-limit

    // Network Settings
    std::string network{"none"};                   ///< "none", "bridge" or a user-defined network

    // Security Settings
    std::vector<std::string> capabilities_drop{"ALL"};  ///< Dropped capabilities
    bool no_new_privileges{true};                  ///< Block setuid escalation
    bool read_only_rootfs{true};                   ///< Read-only root filesystem
    std::vector<std::string> tmpfs{"/tmp"};        ///< Writable scratch mounts
    std::string user;                              ///< uid:gid, empty = image default

    // Filesystem Settings
    std::vector<VolumeMount> mounts;               ///< Bind mounts
    std::string working_dir{"/workspace"};         ///< Working directory

    // Process
    std::map<std::string, std::string> environment_vars;  ///< Environment variables
    std::string entrypoint;                        ///< Overrides the image entrypoint
    std::vector<std::string> command;              ///< Arguments after the image
};

/**
 * @struct ContainerExecResult
 * @brief Result of one runtime CLI call
 */
struct ContainerExecResult {
    int exit_code{-1};              ///< CLI exit code
    std::string stdout_output;      ///< Standard output
    std::string stderr_output;      ///< Standard error
    bool stdout_truncated{false};   ///< stdout hit the ceiling
    bool stderr_truncated{false};   ///< stderr hit the ceiling
    bool timed_out{false};          ///< CLI killed at its deadline
    bool cancelled{false};          ///< CLI killed on cancellation
    std::chrono::milliseconds duration{0};  ///< Execution duration
    bool success{false};            ///< Success flag

    /// Short diagnostic for logs and error lists.
    std::string Describe() const;
};

/**
 * @struct ContainerExitState
 * @brief Terminal state reported by `docker inspect`
 */
struct ContainerExitState {
    std::string status;     ///< created, running, exited, dead...
    bool running{false};
    bool oom_killed{false};
    int exit_code{-1};
    std::string error;      ///< Runtime error text, if any
};

/**
 * @struct ContainerRuntimeOptions
 * @brief How to reach the container runtime
 */
struct ContainerRuntimeOptions {
    std::string binary{"docker"};                          ///< CLI name or path
    std::string docker_host;                               ///< DOCKER_HOST, empty = client default
    std::chrono::seconds command_timeout{60};              ///< Limit for control calls
    std::size_t control_output_bytes{1024 * 1024};         ///< Ceiling for control call output
};

/**
 * @class ContainerUtils
 * @brief Docker container and network management
 *
 * Wraps the subset of the runtime CLI the sandbox needs:
 * - **Networks**: per-scan user-defined networks, labelled for lookup
 * - **Containers**: create with hardening flags, attach-start, inspect,
 *   kill, force-remove
 * - **Discovery**: label-filtered listing for scan cleanup
 *
 * Removal calls are idempotent: a missing container or network counts as
 * removed.
 *
 * **Thread Safety**: Stateless apart from the shared runner; safe to use
 * from many executions at once.
 *
 * **Usage Example**:
 * @code
 * ContainerUtils docker(runner, ContainerRuntimeOptions{});
 *
 * ContainerConfig config;
 * config.name = "threatweaver-run-scan-a-1f2e";
 * config.image = "alpine:3";
 * config.entrypoint = "echo";
 * config.command = {"hello"};
 *
 * std::string id = docker.CreateContainer(config);
 * auto run = docker.StartAttached(id, std::chrono::seconds(10), token, 1 << 20);
 * auto state = docker.InspectState(id);
 * docker.RemoveContainer(id);
 * @endcode
 */
class ContainerUtils {
public:
    ContainerUtils(std::shared_ptr<ProcessRunner> runner, ContainerRuntimeOptions options);

    /**
     * @brief Check if the runtime CLI is installed
     * @param binary CLI name or path
     */
    static bool IsRuntimeAvailable(const std::string& binary);

    /**
     * @brief Daemon version, proving the daemon is reachable
     * @return Version string, or nullopt if the daemon does not answer
     */
    std::optional<std::string> GetServerVersion(std::chrono::seconds timeout);

    /**
     * @brief Create a user-defined bridge network
     *
     * Succeeds if a network with that name already exists.
     */
    ContainerExecResult CreateNetwork(const std::string& name,
                                      const std::map<std::string, std::string>& labels);

    /// Remove a network; succeeds if it does not exist.
    ContainerExecResult RemoveNetwork(const std::string& name);

    /**
     * @brief Names of networks carrying a label
     * @param label_filter "key=value"
     * @throws ContainerError if the runtime call fails
     */
    std::vector<std::string> ListNetworks(const std::string& label_filter);

    /**
     * @brief Create (but do not start) a container
     * @return Container ID
     * @throws ContainerError with the runtime's stderr on failure
     */
    std::string CreateContainer(const ContainerConfig& config);

    /**
     * @brief Start a created container and stream its output until it exits
     *
     * The CLI's stdout/stderr are the container's. When the deadline or the
     * token fires, only the attached client is killed; callers must
     * KillContainer() afterwards.
     */
    ContainerExecResult StartAttached(const std::string& container_id,
                                      std::chrono::milliseconds timeout,
                                      const CancellationToken& cancel_token,
                                      std::size_t max_output_bytes);

    /**
     * @brief Read the container's state
     * @throws ContainerError if inspect fails or its output cannot be parsed
     */
    ContainerExitState InspectState(const std::string& container_id);

    /// SIGKILL the container; succeeds if it already stopped or vanished.
    ContainerExecResult KillContainer(const std::string& container_id);

    /// Force-remove the container; succeeds if it does not exist.
    ContainerExecResult RemoveContainer(const std::string& container_id);

    /**
     * @brief IDs of containers (running or not) carrying a label
     * @throws ContainerError if the runtime call fails
     */
    std::vector<std::string> ListContainers(const std::string& label_filter);

    /**
     * @brief Full `create` argument vector (without the binary)
     *
     * Exposed for inspection in tests and debug logging.
     */
    static std::vector<std::string> BuildCreateCommand(const ContainerConfig& config);

    /**
     * @brief Parse `docker inspect --format '{{json .State}}'` output
     * @throws ContainerError on malformed JSON
     */
    static ContainerExitState ParseStateOutput(const std::string& json);

    const ContainerRuntimeOptions& Options() const { return options_; }

private:
    std::shared_ptr<ProcessRunner> runner_;   ///< Executes CLI calls
    ContainerRuntimeOptions options_;         ///< Runtime location and limits

    ContainerExecResult ExecuteDockerCommand(const std::vector<std::string>& args,
                                             const ProcessOptions& process_options) const;
    ContainerExecResult ExecuteDockerCommand(const std::vector<std::string>& args) const;
    ProcessOptions ControlOptions() const;
    static std::vector<std::string> SplitLines(const std::string& text);
    static bool IsNotFound(const std::string& stderr_text);
};

} // namespace utils
} // namespace threatweaver
