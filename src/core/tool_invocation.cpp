/**
 * @file tool_invocation.cpp
 * @brief Validation of tool invocation specs
 *
 * @date 2025
 */

#include "threatweaver/core/tool_invocation.hpp"
#include "threatweaver/utils/string_utils.hpp"

#include <cmath>
#include <stdexcept>

namespace threatweaver {
namespace core {

using utils::StringUtils;

const std::vector<std::string>& ReservedEnvPrefixes() {
    static const std::vector<std::string> prefixes{"E2B_", "DOCKER_", "THREATWEAVER_"};
    return prefixes;
}

std::vector<std::string> ToolInvocationSpec::Argv() const {
    std::vector<std::string> argv;
    argv.reserve(args_.size() + 1);
    argv.push_back(command_);
    argv.insert(argv.end(), args_.begin(), args_.end());
    return argv;
}

ToolInvocationSpec ToolInvocationBuilder::Build() const {
    if (StringUtils::Trim(spec_.name_).empty()) {
        throw std::invalid_argument("tool name must not be empty");
    }
    if (spec_.command_.empty()) {
        throw std::invalid_argument("tool '" + spec_.name_ + "': command must not be empty");
    }
    if (spec_.timeout_.count() <= 0) {
        throw std::invalid_argument("tool '" + spec_.name_ + "': timeout must be positive");
    }
    if (!(spec_.cpu_limit_ > 0.0) || !std::isfinite(spec_.cpu_limit_)) {
        throw std::invalid_argument("tool '" + spec_.name_ + "': cpu limit must be positive");
    }
    if (spec_.memory_limit_mb_ == 0) {
        throw std::invalid_argument("tool '" + spec_.name_ + "': memory limit must be positive");
    }

    for (const auto& arg : spec_.Argv()) {
        if (arg.find('\0') != std::string::npos) {
            throw std::invalid_argument("tool '" + spec_.name_ + "': argument contains NUL byte");
        }
    }

    for (const auto& [key, value] : spec_.env_) {
        if (!StringUtils::IsValidEnvName(key)) {
            throw std::invalid_argument("tool '" + spec_.name_ +
                                        "': invalid environment variable name '" + key + "'");
        }
        for (const auto& prefix : ReservedEnvPrefixes()) {
            if (StringUtils::StartsWith(key, prefix)) {
                throw std::invalid_argument("tool '" + spec_.name_ + "': environment variable '" +
                                            key + "' uses reserved prefix " + prefix);
            }
        }
        if (value.find('\0') != std::string::npos) {
            throw std::invalid_argument("tool '" + spec_.name_ + "': environment variable '" +
                                        key + "' contains NUL byte");
        }
    }

    for (const auto& output : spec_.declared_outputs_) {
        if (output.empty()) {
            throw std::invalid_argument("tool '" + spec_.name_ + "': declared output path is empty");
        }
    }

    return spec_;
}

} // namespace core
} // namespace threatweaver
