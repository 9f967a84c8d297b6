/**
 * @file sandbox_provider.hpp
 * @brief Backend-neutral contract for running tools in isolated sandboxes
 *
 * Callers program against SandboxProvider only. The concrete backend (a
 * remote micro-VM service or the local container runtime) is chosen once
 * by CreateSandboxProvider() from an explicit SandboxConfig.
 *
 * **Contract**:
 * - Execute() never throws for runtime failures; they come back as a
 *   result with success=false and one of three ErrorKind values
 * - Execute() never leaves a sandbox running after it returns
 * - Cleanup() is idempotent and never throws
 * - HealthCheck() has no side effects and never creates a sandbox
 *
 * @date 2025
 */

#pragma once

#include "threatweaver/core/execution_result.hpp"
#include "threatweaver/core/tool_invocation.hpp"
#include "threatweaver/utils/cancellation_token.hpp"

#include <filesystem>
#include <future>
#include <string>

namespace threatweaver {
namespace core {

/**
 * @class SandboxProvider
 * @brief Abstract sandbox backend
 *
 * **Thread Safety**: All methods may be called concurrently from many
 * threads. Many Execute() calls may be in flight at once, across scans
 * and within one scan; each gets its own sandbox instance.
 *
 * **Usage Example**:
 * @code
 * auto provider = CreateSandboxProvider(SandboxConfig::FromEnv());
 *
 * auto spec = ToolInvocationBuilder("echo")
 *     .WithCommand("echo")
 *     .AddArg("hello")
 *     .Build();
 *
 * auto result = provider->Execute(spec, "/srv/scans/42", "scan-42");
 * if (!result.success) {
 *     spdlog::error("{}: {}", ErrorKindToString(result.error->kind), result.error->message);
 * }
 *
 * provider->Cleanup("scan-42");
 * @endcode
 */
class SandboxProvider {
public:
    virtual ~SandboxProvider() = default;

    /// Backend kind ("e2b", "docker").
    virtual std::string Name() const = 0;

    /**
     * @brief Run one tool invocation in a fresh sandbox
     *
     * Blocks until the tool exits, its timeout passes, or the token is
     * cancelled; the sandbox is destroyed before returning.
     *
     * @param spec Validated invocation
     * @param workspace_dir Host directory exchanged with the sandbox at /workspace
     * @param scan_id Namespace key; distinct ids never share resources
     * @param cancel_token Cancels the run and forces teardown
     * @return Result describing the run; never throws for runtime failures
     */
    virtual SandboxExecutionResult Execute(const ToolInvocationSpec& spec,
                                           const std::filesystem::path& workspace_dir,
                                           const std::string& scan_id,
                                           const utils::CancellationToken& cancel_token =
                                               utils::CancellationToken()) = 0;

    /**
     * @brief Release every backend resource belonging to a scan
     *
     * Call after all Execute() calls for the scan have returned. Failures
     * are logged and listed in the report.
     */
    virtual CleanupReport Cleanup(const std::string& scan_id) = 0;

    /// Cheap reachability and credential probe.
    virtual bool HealthCheck() = 0;

    /**
     * @brief Execute() on a dedicated thread
     *
     * The provider must outlive the returned future; arguments are copied.
     */
    std::future<SandboxExecutionResult> ExecuteAsync(const ToolInvocationSpec& spec,
                                                     const std::filesystem::path& workspace_dir,
                                                     const std::string& scan_id,
                                                     const utils::CancellationToken& cancel_token =
                                                         utils::CancellationToken()) {
        return std::async(std::launch::async,
                          [this, spec, workspace_dir, scan_id, cancel_token]() {
                              return Execute(spec, workspace_dir, scan_id, cancel_token);
                          });
    }
};

} // namespace core
} // namespace threatweaver
