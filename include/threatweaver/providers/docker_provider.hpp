/**
 * @file docker_provider.hpp
 * @brief Local container backend
 *
 * Runs each invocation in a fresh, hardened container on the local Docker
 * daemon. The scan workspace is bind-mounted read-write at /workspace, so
 * output files land directly on the host.
 *
 * **Architecture**:
 * ```
 * DockerProvider
 *     ↓ ContainerUtils (argv, no shell)
 * docker CLI  ──DOCKER_HOST──>  dockerd
 *                                 ├─ network threatweaver-net-<slug>   (per scan)
 *                                 └─ container threatweaver-run-<slug>-<rand>  (per call)
 * ```
 *
 * @date 2025
 */

#pragma once

#include "threatweaver/core/isolation_namespace.hpp"
#include "threatweaver/core/sandbox_config.hpp"
#include "threatweaver/core/sandbox_provider.hpp"
#include "threatweaver/utils/container_utils.hpp"

#include <memory>
#include <string>

namespace threatweaver {
namespace providers {

/**
 * @class DockerProvider
 * @brief SandboxProvider backed by the Docker CLI
 *
 * Per invocation:
 * 1. Snapshot declared outputs
 * 2. Ensure the scan network (unless isolation is off or egress is blocked)
 * 3. `docker create` with resource ceilings and hardening flags
 * 4. `docker start -a` under the tool's deadline and the cancel token
 * 5. `docker inspect` for exit code and OOM kill, or `docker kill` on overrun
 * 6. Collect declared outputs from the bind mount
 * 7. `docker rm -f`
 *
 * **Thread Safety**: Holds no per-execution state; Execute() may run
 * concurrently.
 */
class DockerProvider : public core::SandboxProvider {
public:
    DockerProvider(const core::SandboxConfig& config,
                   std::shared_ptr<utils::ProcessRunner> runner);

    std::string Name() const override { return "docker"; }

    core::SandboxExecutionResult Execute(const core::ToolInvocationSpec& spec,
                                         const std::filesystem::path& workspace_dir,
                                         const std::string& scan_id,
                                         const utils::CancellationToken& cancel_token =
                                             utils::CancellationToken()) override;

    core::CleanupReport Cleanup(const std::string& scan_id) override;

    bool HealthCheck() override;

private:
    core::SandboxConfig config_;     ///< Backend settings
    utils::ContainerUtils docker_;   ///< CLI wrapper

    void RunInContainer(const core::ToolInvocationSpec& spec,
                        const std::filesystem::path& workspace_dir,
                        const std::string& scan_id,
                        const utils::CancellationToken& cancel_token,
                        core::SandboxExecutionResult& result,
                        std::string& container_id);

    utils::ContainerConfig BuildContainerConfig(const core::ToolInvocationSpec& spec,
                                                const std::filesystem::path& workspace,
                                                const core::IsolationNamespace& ns,
                                                const std::string& network) const;

    std::string PrepareNetwork(const core::ToolInvocationSpec& spec,
                               const core::IsolationNamespace& ns);

    void TeardownContainer(std::string& container_id, core::SandboxExecutionResult& result);

    std::string ContainerUser() const;
};

} // namespace providers
} // namespace threatweaver
