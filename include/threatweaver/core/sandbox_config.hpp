/**
 * @file sandbox_config.hpp
 * @brief Explicit configuration of the sandbox execution engine
 *
 * There is no process-wide default configuration. Callers build a
 * SandboxConfig (from the environment, a JSON file, or by hand) and pass
 * it to CreateSandboxProvider().
 *
 * **Environment Variables**:
 * | Variable                  | Field                  | Default                        |
 * |---------------------------|------------------------|--------------------------------|
 * | SANDBOX_PROVIDER          | provider               | e2b                            |
 * | E2B_API_KEY               | e2b_api_key            | (none)                         |
 * | E2B_TEMPLATE_ID           | e2b_template_id        | base                           |
 * | E2B_API_URL               | e2b_api_url            | https://api.e2b.app            |
 * | E2B_DOMAIN                | e2b_domain             | e2b.app                        |
 * | E2B_TEMPLATE_CPU          | e2b_template_cpu       | 8                              |
 * | E2B_TEMPLATE_MEMORY_MB    | e2b_template_memory_mb | 8192                           |
 * | DOCKER_HOST               | docker_host            | unix:///var/run/docker.sock    |
 * | SANDBOX_DOCKER_IMAGE      | docker_image           | threatweaver-security:latest   |
 * | SANDBOX_CPU_LIMIT         | cpu_limit              | 2.0                            |
 * | SANDBOX_MEMORY_LIMIT      | memory_limit_mb        | 4096                           |
 * | SANDBOX_TIMEOUT           | timeout (seconds)      | 3600                           |
 * | SANDBOX_MAX_OUTPUT_BYTES  | max_output_bytes       | 10485760                       |
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace threatweaver {
namespace core {

/**
 * @class ConfigurationError
 * @brief Invalid or incomplete configuration
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @struct E2bTemplateSize
 * @brief A remote template and the VM size it was built with
 *
 * Remote sandboxes cannot be resized at creation, so the memory and CPU
 * ceilings of an invocation are enforced by choosing the smallest template
 * that still fits them.
 */
struct E2bTemplateSize {
    std::string template_id;
    double cpu{0.0};            ///< vCPUs
    std::size_t memory_mb{0};   ///< MiB
};

/// Looks up one environment variable; nullopt when unset.
using EnvGetter = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @struct SandboxConfig
 * @brief Backend selection, credentials, defaults and ceilings
 */
struct SandboxConfig {
    // Provider selection
    std::string provider{"e2b"};  ///< "e2b" or "docker"

    // Remote micro-VM backend
    std::string e2b_api_key;                          ///< Control plane credential (never logged)
    std::string e2b_template_id{"base"};              ///< Template used when the invocation names none
    std::string e2b_api_url{"https://api.e2b.app"};   ///< Control plane base URL
    std::string e2b_domain{"e2b.app"};                ///< Domain of in-sandbox agents
    std::string e2b_user{"user"};                     ///< Account the tool runs as in the VM
    double e2b_template_cpu{8.0};                     ///< vCPUs of the template
    std::size_t e2b_template_memory_mb{8192};         ///< Memory of the template
    std::chrono::seconds e2b_timeout_grace{30};       ///< Extra sandbox lifetime beyond the tool timeout
    std::vector<E2bTemplateSize> e2b_template_sizes;  ///< Sized variants of the default template

    // Local container backend
    std::string docker_binary{"docker"};                      ///< CLI name or path
    std::string docker_host{"unix:///var/run/docker.sock"};   ///< Passed as DOCKER_HOST
    std::string docker_image{"threatweaver-security:latest"}; ///< Image used when the invocation names none
    int pids_limit{512};                                      ///< Per-container process ceiling
    std::string container_user;                               ///< uid:gid, empty = caller's

    // Invocation defaults
    double cpu_limit{2.0};                 ///< Cores
    std::size_t memory_limit_mb{4096};     ///< MiB
    std::chrono::seconds timeout{3600};    ///< Wall-clock limit

    // Ceilings
    std::size_t max_output_bytes{10 * 1024 * 1024};        ///< Per stream
    std::size_t max_output_file_bytes{50 * 1024 * 1024};   ///< Per declared output
    std::size_t max_upload_bytes{100 * 1024 * 1024};       ///< Workspace upload total

    // Naming and probes
    std::string resource_prefix{"threatweaver"};           ///< Prefix of every backend resource
    std::chrono::seconds request_timeout{30};              ///< Control plane calls
    std::chrono::seconds transfer_timeout{300};            ///< Each workspace file upload or download
    std::chrono::seconds health_check_timeout{10};         ///< HealthCheck() budget

    /**
     * @brief Load from environment variables (see table above)
     * @param getter Variable lookup; defaults to the process environment
     * @throws ConfigurationError if a numeric variable does not parse
     */
    static SandboxConfig FromEnv(const EnvGetter& getter = ProcessEnvironment());

    /**
     * @brief Load from a JSON file whose keys match the field names
     *
     * Durations are given in seconds. Unknown keys are ignored.
     * e2b_template_sizes is a list of {"template_id", "cpu", "memory_mb"}.
     *
     * @throws ConfigurationError if the file is missing or malformed
     */
    static SandboxConfig FromJsonFile(const std::filesystem::path& path);

    /// Parse the same keys from an in-memory JSON document.
    static SandboxConfig FromJsonString(const std::string& text);

    /**
     * @brief Check value ranges
     * @throws ConfigurationError describing the first invalid value
     */
    void Validate() const;

    /// Getter reading the real process environment.
    static EnvGetter ProcessEnvironment();
};

} // namespace core
} // namespace threatweaver
