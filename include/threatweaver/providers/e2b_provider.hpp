/**
 * @file e2b_provider.hpp
 * @brief Remote micro-VM backend
 *
 * Each invocation gets its own Firecracker micro-VM from the E2B service.
 * The local workspace is uploaded to /workspace inside the VM before the
 * tool starts, and declared outputs are written back afterwards.
 *
 * @date 2025
 */

#pragma once

#include "threatweaver/core/isolation_namespace.hpp"
#include "threatweaver/core/sandbox_config.hpp"
#include "threatweaver/core/sandbox_provider.hpp"
#include "threatweaver/providers/e2b_client.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace threatweaver {
namespace providers {

/**
 * @class E2bProvider
 * @brief SandboxProvider backed by E2B cloud sandboxes
 *
 * Per invocation:
 * 1. Admit the request against the template's CPU and memory capacity
 * 2. Create a sandbox tagged with the scan's namespace metadata; its
 *    service-side lifetime is the tool timeout plus a grace period, so it
 *    expires even if this process dies
 * 3. Upload the workspace
 * 4. Stream the process through the agent until exit, deadline or cancel
 * 5. Download declared outputs into the local workspace
 * 6. Kill the sandbox
 *
 * Live sandboxes are tracked per scan so Cleanup() can kill stragglers;
 * Cleanup() also searches the service by metadata to catch sandboxes left
 * by an earlier process.
 *
 * **Thread Safety**: The registry is guarded by a mutex; everything else is
 * per call.
 */
class E2bProvider : public core::SandboxProvider {
public:
    E2bProvider(const core::SandboxConfig& config,
                std::shared_ptr<utils::HttpTransport> transport);

    std::string Name() const override { return "e2b"; }

    core::SandboxExecutionResult Execute(const core::ToolInvocationSpec& spec,
                                         const std::filesystem::path& workspace_dir,
                                         const std::string& scan_id,
                                         const utils::CancellationToken& cancel_token =
                                             utils::CancellationToken()) override;

    core::CleanupReport Cleanup(const std::string& scan_id) override;

    bool HealthCheck() override;

    /// Sandboxes currently registered for a scan.
    std::size_t ActiveSandboxCount(const std::string& scan_id) const;

    /**
     * @brief Template an invocation runs in, with the capacity it enforces
     *
     * A bare image name is taken as an explicit template. Registry-style
     * references ("org/tool:tag") name container images and fall back to
     * the configured template, in which case the smallest of
     * e2b_template_sizes and the default template that fits the
     * invocation's CPU and memory limits is chosen.
     *
     * @throws E2bError if the chosen or every candidate template is too small
     */
    core::E2bTemplateSize SelectTemplate(const core::ToolInvocationSpec& spec) const;

private:
    core::SandboxConfig config_;   ///< Backend settings
    E2bClient client_;             ///< Protocol client

    mutable std::mutex registry_mutex_;                      ///< Guards active_
    std::map<std::string, std::set<std::string>> active_;    ///< Namespace slug -> sandbox ids

    void RunInSandbox(const core::ToolInvocationSpec& spec,
                      const std::filesystem::path& workspace_dir,
                      const std::string& scan_id,
                      const utils::CancellationToken& cancel_token,
                      core::SandboxExecutionResult& result,
                      std::string& slug,
                      std::string& sandbox_id);

    void UploadWorkspace(const E2bSandbox& sandbox, const std::filesystem::path& workspace,
                         const utils::CancellationToken& cancel_token);

    void DownloadOutputs(const E2bSandbox& sandbox,
                         const core::ToolInvocationSpec& spec,
                         const std::filesystem::path& workspace,
                         const utils::CancellationToken& cancel_token);

    void TeardownSandbox(const std::string& slug, std::string& sandbox_id,
                         core::SandboxExecutionResult& result);

    void Register(const std::string& slug, const std::string& sandbox_id);
    void Unregister(const std::string& slug, const std::string& sandbox_id);
    std::vector<std::string> TakeRegistered(const std::string& slug);
};

} // namespace providers
} // namespace threatweaver
