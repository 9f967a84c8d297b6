/**
 * @file provider_factory.cpp
 * @brief Backend selection
 *
 * @date 2025
 */

#include "threatweaver/core/provider_factory.hpp"
#include "threatweaver/providers/docker_provider.hpp"
#include "threatweaver/providers/e2b_provider.hpp"
#include "threatweaver/utils/container_utils.hpp"
#include "threatweaver/utils/http_transport.hpp"
#include "threatweaver/utils/process_runner.hpp"
#include "threatweaver/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace threatweaver {
namespace core {

const std::vector<std::string>& SupportedProviders() {
    static const std::vector<std::string> providers = {"e2b", "docker"};
    return providers;
}

std::unique_ptr<SandboxProvider> CreateSandboxProvider(const SandboxConfig& config,
                                                       ProviderDependencies dependencies) {
    config.Validate();
    spdlog::debug("Selecting sandbox provider '{}'", config.provider);

    if (config.provider == "e2b") {
        if (config.e2b_api_key.empty()) {
            throw ConfigurationError("provider 'e2b' requires E2B_API_KEY");
        }
        if (!dependencies.http_transport) {
            dependencies.http_transport = std::make_shared<utils::CurlHttpTransport>();
        }
        return std::make_unique<providers::E2bProvider>(config, dependencies.http_transport);
    }

    if (config.provider == "docker") {
        if (!dependencies.process_runner) {
            if (!utils::ContainerUtils::IsRuntimeAvailable(config.docker_binary)) {
                throw ProviderUnavailableError("container runtime '" + config.docker_binary +
                                               "' not found on PATH");
            }
            dependencies.process_runner = std::make_shared<utils::PosixProcessRunner>();
        }
        return std::make_unique<providers::DockerProvider>(config, dependencies.process_runner);
    }

    throw ConfigurationError("unknown sandbox provider '" + config.provider + "' (supported: " +
                             utils::StringUtils::Join(SupportedProviders(), ", ") + ")");
}

} // namespace core
} // namespace threatweaver
