/**
 * @file tool_invocation.hpp
 * @brief Immutable description of one sandboxed tool run
 *
 * A ToolInvocationSpec names the program to run, its literal argument
 * vector, environment, resource ceilings and network policy. Specs are
 * validated once at construction and never change afterwards, so one spec
 * can be shared between threads and reused across scans.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace threatweaver {
namespace core {

/**
 * @class ToolInvocationSpec
 * @brief Validated, read-only tool invocation
 *
 * Instances are produced by ToolInvocationBuilder::Build(). All accessors
 * are const.
 */
class ToolInvocationSpec {
public:
    static constexpr std::chrono::seconds kDefaultTimeout{3600};
    static constexpr double kDefaultCpuLimit = 2.0;
    static constexpr std::size_t kDefaultMemoryLimitMb = 4096;

    const std::string& Name() const { return name_; }

    /// Image or template reference; empty means the backend default.
    const std::string& Image() const { return image_; }

    const std::string& Command() const { return command_; }
    const std::vector<std::string>& Args() const { return args_; }
    const std::map<std::string, std::string>& Env() const { return env_; }
    std::chrono::seconds Timeout() const { return timeout_; }
    double CpuLimit() const { return cpu_limit_; }
    std::size_t MemoryLimitMb() const { return memory_limit_mb_; }

    /// No route to sandboxes of other scans.
    bool NetworkIsolated() const { return network_isolated_; }

    /// No general internet egress either.
    bool BlockEgress() const { return block_egress_; }

    /// Workspace-relative paths the tool is expected to write.
    const std::vector<std::string>& DeclaredOutputs() const { return declared_outputs_; }

    /// Command followed by arguments, as passed to exec.
    std::vector<std::string> Argv() const;

private:
    friend class ToolInvocationBuilder;
    ToolInvocationSpec() = default;

    std::string name_;
    std::string image_;
    std::string command_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> env_;
    std::chrono::seconds timeout_{kDefaultTimeout};
    double cpu_limit_{kDefaultCpuLimit};
    std::size_t memory_limit_mb_{kDefaultMemoryLimitMb};
    bool network_isolated_{true};
    bool block_egress_{false};
    std::vector<std::string> declared_outputs_;
};

/**
 * @class ToolInvocationBuilder
 * @brief Fluent API for constructing ToolInvocationSpec objects
 *
 * **Usage Example**:
 * @code
 * auto spec = ToolInvocationBuilder("subfinder")
 *     .WithImage("projectdiscovery/subfinder:latest")
 *     .WithCommand("subfinder")
 *     .WithArgs({"-d", "example.com", "-o", "/workspace/subs.txt", "-silent"})
 *     .WithTimeout(std::chrono::minutes(30))
 *     .WithCpuLimit(1.0)
 *     .WithMemoryLimit(1024)
 *     .DeclareOutput("/workspace/subs.txt")
 *     .Build();
 * @endcode
 */
class ToolInvocationBuilder {
public:
    explicit ToolInvocationBuilder(const std::string& name) { spec_.name_ = name; }

    ToolInvocationBuilder& WithImage(const std::string& image) {
        spec_.image_ = image;
        return *this;
    }

    ToolInvocationBuilder& WithCommand(const std::string& command) {
        spec_.command_ = command;
        return *this;
    }

    ToolInvocationBuilder& WithArgs(const std::vector<std::string>& args) {
        spec_.args_ = args;
        return *this;
    }

    ToolInvocationBuilder& AddArg(const std::string& arg) {
        spec_.args_.push_back(arg);
        return *this;
    }

    ToolInvocationBuilder& WithEnv(const std::string& name, const std::string& value) {
        spec_.env_[name] = value;
        return *this;
    }

    ToolInvocationBuilder& WithTimeout(std::chrono::seconds timeout) {
        spec_.timeout_ = timeout;
        return *this;
    }

    ToolInvocationBuilder& WithCpuLimit(double cores) {
        spec_.cpu_limit_ = cores;
        return *this;
    }

    ToolInvocationBuilder& WithMemoryLimit(std::size_t mb) {
        spec_.memory_limit_mb_ = mb;
        return *this;
    }

    ToolInvocationBuilder& WithNetworkIsolation(bool isolated = true) {
        spec_.network_isolated_ = isolated;
        return *this;
    }

    ToolInvocationBuilder& WithBlockedEgress(bool blocked = true) {
        spec_.block_egress_ = blocked;
        return *this;
    }

    ToolInvocationBuilder& DeclareOutput(const std::string& path) {
        spec_.declared_outputs_.push_back(path);
        return *this;
    }

    /**
     * @brief Validate and produce the invocation
     *
     * Checks:
     * - name and command are non-empty
     * - timeout, cpu and memory limits are positive
     * - env names match [A-Za-z_][A-Za-z0-9_]* and avoid reserved prefixes
     * - declared outputs are non-empty strings
     *
     * @throws std::invalid_argument describing the first violation
     */
    ToolInvocationSpec Build() const;

private:
    ToolInvocationSpec spec_;
};

/// Prefixes of environment variables owned by the backends' control planes.
const std::vector<std::string>& ReservedEnvPrefixes();

} // namespace core
} // namespace threatweaver
