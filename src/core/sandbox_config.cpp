/**
 * @file sandbox_config.cpp
 * @brief Loading and validation of SandboxConfig
 *
 * @date 2025
 */

#include "threatweaver/core/sandbox_config.hpp"
#include "threatweaver/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace threatweaver {
namespace core {

using utils::StringUtils;

namespace {

// ============================================================================
// VALUE PARSING
// ============================================================================

double ParseDouble(const std::string& name, const std::string& raw) {
    std::string value = StringUtils::Trim(raw);
    try {
        std::size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigurationError(name + ": expected a number, got '" + raw + "'");
    }
}

unsigned long long ParseUnsigned(const std::string& name, const std::string& raw) {
    std::string value = StringUtils::Trim(raw);
    if (value.empty() || value.front() == '-') {
        throw ConfigurationError(name + ": expected a non-negative integer, got '" + raw + "'");
    }
    try {
        std::size_t consumed = 0;
        unsigned long long parsed = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigurationError(name + ": expected a non-negative integer, got '" + raw + "'");
    }
}

void ApplyJson(const json& j, SandboxConfig& config) {
    config.provider = j.value("provider", config.provider);

    config.e2b_api_key = j.value("e2b_api_key", config.e2b_api_key);
    config.e2b_template_id = j.value("e2b_template_id", config.e2b_template_id);
    config.e2b_api_url = j.value("e2b_api_url", config.e2b_api_url);
    config.e2b_domain = j.value("e2b_domain", config.e2b_domain);
    config.e2b_user = j.value("e2b_user", config.e2b_user);
    config.e2b_template_cpu = j.value("e2b_template_cpu", config.e2b_template_cpu);
    config.e2b_template_memory_mb = j.value("e2b_template_memory_mb", config.e2b_template_memory_mb);
    config.e2b_timeout_grace = std::chrono::seconds(
        j.value("e2b_timeout_grace", static_cast<long long>(config.e2b_timeout_grace.count())));
    if (j.contains("e2b_template_sizes")) {
        config.e2b_template_sizes.clear();
        for (const auto& entry : j.at("e2b_template_sizes")) {
            E2bTemplateSize size;
            size.template_id = entry.at("template_id").get<std::string>();
            size.cpu = entry.at("cpu").get<double>();
            size.memory_mb = entry.at("memory_mb").get<std::size_t>();
            config.e2b_template_sizes.push_back(size);
        }
    }

    config.docker_binary = j.value("docker_binary", config.docker_binary);
    config.docker_host = j.value("docker_host", config.docker_host);
    config.docker_image = j.value("docker_image", config.docker_image);
    config.pids_limit = j.value("pids_limit", config.pids_limit);
    config.container_user = j.value("container_user", config.container_user);

    config.cpu_limit = j.value("cpu_limit", config.cpu_limit);
    config.memory_limit_mb = j.value("memory_limit_mb", config.memory_limit_mb);
    config.timeout = std::chrono::seconds(
        j.value("timeout", static_cast<long long>(config.timeout.count())));

    config.max_output_bytes = j.value("max_output_bytes", config.max_output_bytes);
    config.max_output_file_bytes = j.value("max_output_file_bytes", config.max_output_file_bytes);
    config.max_upload_bytes = j.value("max_upload_bytes", config.max_upload_bytes);

    config.resource_prefix = j.value("resource_prefix", config.resource_prefix);
    config.request_timeout = std::chrono::seconds(
        j.value("request_timeout", static_cast<long long>(config.request_timeout.count())));
    config.transfer_timeout = std::chrono::seconds(
        j.value("transfer_timeout", static_cast<long long>(config.transfer_timeout.count())));
    config.health_check_timeout = std::chrono::seconds(
        j.value("health_check_timeout", static_cast<long long>(config.health_check_timeout.count())));
}

} // anonymous namespace

// ============================================================================
// LOADERS
// ============================================================================

EnvGetter SandboxConfig::ProcessEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

SandboxConfig SandboxConfig::FromEnv(const EnvGetter& getter) {
    SandboxConfig config;

    auto get = [&getter](const std::string& name) -> std::optional<std::string> {
        auto value = getter(name);
        if (value && StringUtils::Trim(*value).empty()) {
            return std::nullopt;
        }
        return value;
    };

    if (auto v = get("SANDBOX_PROVIDER")) config.provider = StringUtils::ToLower(StringUtils::Trim(*v));
    if (auto v = get("E2B_API_KEY")) config.e2b_api_key = StringUtils::Trim(*v);
    if (auto v = get("E2B_TEMPLATE_ID")) config.e2b_template_id = StringUtils::Trim(*v);
    if (auto v = get("E2B_API_URL")) config.e2b_api_url = StringUtils::Trim(*v);
    if (auto v = get("E2B_DOMAIN")) config.e2b_domain = StringUtils::Trim(*v);
    if (auto v = get("E2B_TEMPLATE_CPU")) config.e2b_template_cpu = ParseDouble("E2B_TEMPLATE_CPU", *v);
    if (auto v = get("E2B_TEMPLATE_MEMORY_MB")) {
        config.e2b_template_memory_mb = ParseUnsigned("E2B_TEMPLATE_MEMORY_MB", *v);
    }
    if (auto v = get("DOCKER_HOST")) config.docker_host = StringUtils::Trim(*v);
    if (auto v = get("SANDBOX_DOCKER_IMAGE")) config.docker_image = StringUtils::Trim(*v);
    if (auto v = get("SANDBOX_CPU_LIMIT")) config.cpu_limit = ParseDouble("SANDBOX_CPU_LIMIT", *v);
    if (auto v = get("SANDBOX_MEMORY_LIMIT")) {
        config.memory_limit_mb = ParseUnsigned("SANDBOX_MEMORY_LIMIT", *v);
    }
    if (auto v = get("SANDBOX_TIMEOUT")) {
        config.timeout = std::chrono::seconds(ParseUnsigned("SANDBOX_TIMEOUT", *v));
    }
    if (auto v = get("SANDBOX_MAX_OUTPUT_BYTES")) {
        config.max_output_bytes = ParseUnsigned("SANDBOX_MAX_OUTPUT_BYTES", *v);
    }

    return config;
}

SandboxConfig SandboxConfig::FromJsonString(const std::string& text) {
    SandboxConfig config;
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            throw ConfigurationError("configuration must be a JSON object");
        }
        ApplyJson(j, config);
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("invalid configuration JSON: ") + e.what());
    }
    return config;
}

SandboxConfig SandboxConfig::FromJsonFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigurationError("cannot open configuration file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    spdlog::debug("Loading configuration from {}", path.string());
    return FromJsonString(buffer.str());
}

// ============================================================================
// VALIDATION
// ============================================================================

void SandboxConfig::Validate() const {
    if (provider.empty()) {
        throw ConfigurationError("provider must not be empty");
    }
    if (!(cpu_limit > 0.0) || !std::isfinite(cpu_limit)) {
        throw ConfigurationError("cpu_limit must be positive");
    }
    if (memory_limit_mb == 0) {
        throw ConfigurationError("memory_limit_mb must be positive");
    }
    if (timeout.count() <= 0) {
        throw ConfigurationError("timeout must be positive");
    }
    if (max_output_bytes == 0) {
        throw ConfigurationError("max_output_bytes must be positive");
    }
    if (max_output_file_bytes == 0) {
        throw ConfigurationError("max_output_file_bytes must be positive");
    }
    if (pids_limit <= 0) {
        throw ConfigurationError("pids_limit must be positive");
    }
    if (!(e2b_template_cpu > 0.0) || e2b_template_memory_mb == 0) {
        throw ConfigurationError("e2b template capacity must be positive");
    }
    if (e2b_timeout_grace.count() < 0) {
        throw ConfigurationError("e2b_timeout_grace must not be negative");
    }
    if (request_timeout.count() <= 0 || health_check_timeout.count() <= 0 || transfer_timeout.count() <= 0) {
        throw ConfigurationError("request, transfer and health check timeouts must be positive");
    }
    for (const auto& size : e2b_template_sizes) {
        if (size.template_id.empty() || !(size.cpu > 0.0) || size.memory_mb == 0) {
            throw ConfigurationError("e2b_template_sizes entries need a template_id and positive capacity");
        }
    }
    if (!StringUtils::StartsWith(e2b_api_url, "http://") &&
        !StringUtils::StartsWith(e2b_api_url, "https://")) {
        throw ConfigurationError("e2b_api_url must be an http(s) URL: " + e2b_api_url);
    }
    if (resource_prefix.empty()) {
        throw ConfigurationError("resource_prefix must not be empty");
    }
}

} // namespace core
} // namespace threatweaver
