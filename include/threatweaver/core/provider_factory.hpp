/**
 * @file provider_factory.hpp
 * @brief Construction of the configured sandbox backend
 *
 * @date 2025
 */

#pragma once

#include "threatweaver/core/sandbox_config.hpp"
#include "threatweaver/core/sandbox_provider.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace threatweaver {

namespace utils {
class ProcessRunner;
class HttpTransport;
}

namespace core {

/**
 * @class ProviderUnavailableError
 * @brief Selected backend cannot run on this host
 */
class ProviderUnavailableError : public std::runtime_error {
public:
    explicit ProviderUnavailableError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @struct ProviderDependencies
 * @brief Optional collaborators; null members get production defaults
 */
struct ProviderDependencies {
    std::shared_ptr<utils::ProcessRunner> process_runner;  ///< Docker backend CLI runner
    std::shared_ptr<utils::HttpTransport> http_transport;  ///< E2B backend HTTP client
};

/// Provider names accepted in SandboxConfig::provider.
const std::vector<std::string>& SupportedProviders();

/**
 * @brief Build the backend named by config.provider
 *
 * @throws ConfigurationError for an unknown provider, missing credentials
 *         or invalid values
 * @throws ProviderUnavailableError if the backend's prerequisites are
 *         missing on this host (no container CLI on PATH)
 */
std::unique_ptr<SandboxProvider> CreateSandboxProvider(const SandboxConfig& config,
                                                       ProviderDependencies dependencies = {});

} // namespace core
} // namespace threatweaver
