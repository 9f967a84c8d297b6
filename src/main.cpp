/**
 * @file main.cpp
 * @brief ThreatWeaver sandbox - Command-line interface
 *
 * Runs one security tool invocation in an isolated sandbox and prints the
 * result as JSON on stdout. Logs go to stderr so the output can be piped.
 *
 * **Exit Codes**:
 * - 0: tool exited 0
 * - 1: execution fault (non-zero exit, setup failure, cancellation)
 * - 2: timeout fault
 * - 3: resource fault
 * - 4: configuration error or unavailable backend
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stderr_color_sinks.h>

#include "threatweaver/core/provider_factory.hpp"
#include "threatweaver/core/tool_catalog.hpp"
#include "threatweaver/utils/cancellation_token.hpp"

#include <atomic>
#include <iostream>
#include <thread>

#include <pthread.h>
#include <signal.h>
#include <time.h>

using namespace threatweaver;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitExecutionFault = 1;
constexpr int kExitTimeout = 2;
constexpr int kExitResource = 3;
constexpr int kExitConfiguration = 4;

/*******************************************************************************
 * Signal Handling
 ******************************************************************************/

/**
 * @class SignalWatcher
 * @brief Turns SIGINT/SIGTERM into a cancellation request
 *
 * The signals are consumed synchronously by a watcher thread, so
 * cancellation runs outside signal-handler context. BlockedSignals() must
 * be blocked in the main thread before any other thread starts.
 */
class SignalWatcher {
public:
    static sigset_t BlockedSignals() {
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        return signals;
    }

    explicit SignalWatcher(utils::CancellationToken token)
        : token_(std::move(token)), signals_(BlockedSignals()) {
        thread_ = std::thread([this] { Watch(); });
    }

    ~SignalWatcher() {
        stop_ = true;
        thread_.join();
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    utils::CancellationToken token_;
    sigset_t signals_;
    std::atomic<bool> stop_{false};
    std::thread thread_;

    void Watch() {
        timespec interval{0, 200 * 1000 * 1000};
        while (!stop_) {
            int sig = sigtimedwait(&signals_, nullptr, &interval);
            if (sig == SIGINT || sig == SIGTERM) {
                spdlog::warn("Received signal {}, cancelling execution", sig);
                token_.Cancel();
            }
        }
    }
};

/*******************************************************************************
 * Helpers
 ******************************************************************************/

core::SandboxConfig LoadConfig(const std::string& config_file, const std::string& provider) {
    core::SandboxConfig config = config_file.empty()
        ? core::SandboxConfig::FromEnv()
        : core::SandboxConfig::FromJsonFile(config_file);
    if (!provider.empty()) {
        config.provider = provider;
    }
    return config;
}

std::pair<std::string, std::string> SplitAssignment(const std::string& text, const std::string& what) {
    auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw std::invalid_argument(what + " must be KEY=VALUE: " + text);
    }
    return {text.substr(0, eq), text.substr(eq + 1)};
}

int ExitCodeFor(const core::SandboxExecutionResult& result) {
    if (result.success) {
        return kExitSuccess;
    }
    if (result.error && result.error->kind == core::ErrorKind::kTimeout) {
        return kExitTimeout;
    }
    if (result.error && result.error->kind == core::ErrorKind::kResource) {
        return kExitResource;
    }
    return kExitExecutionFault;
}

int RunInvocation(core::SandboxProvider& provider,
                  const core::ToolInvocationSpec& spec,
                  const std::string& workspace,
                  const std::string& scan_id) {
    utils::CancellationToken token;
    core::SandboxExecutionResult result;
    {
        SignalWatcher watcher(token);
        spdlog::info("Executing '{}' on {} backend (scan {})", spec.Name(), provider.Name(), scan_id);
        result = provider.Execute(spec, workspace, scan_id, token);
    }

    std::cout << result.ToJson() << std::endl;
    for (const auto& failure : result.teardown_errors) {
        spdlog::warn("Teardown: {}", failure);
    }
    return ExitCodeFor(result);
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"ThreatWeaver sandbox execution engine"};
    app.require_subcommand(1);

    std::string config_file;
    std::string provider_name;
    bool verbose = false;

    app.add_option("-c,--config", config_file, "JSON configuration file (default: environment)")
        ->check(CLI::ExistingFile);
    app.add_option("-p,--provider", provider_name, "Sandbox backend")
        ->check(CLI::IsMember(core::SupportedProviders()));
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");

    // ---- run ----
    auto* run_cmd = app.add_subcommand("run", "Run an arbitrary command in a sandbox");
    std::string scan_id;
    std::string workspace;
    std::string tool_name = "command";
    std::string image;
    int timeout_seconds = 0;
    double cpu_limit = 0.0;
    std::size_t memory_mb = 0;
    bool no_network_isolation = false;
    bool block_egress = false;
    std::vector<std::string> outputs;
    std::vector<std::string> env_pairs;
    std::vector<std::string> command_line;

    run_cmd->add_option("--scan-id", scan_id, "Scan identifier")->required();
    run_cmd->add_option("-w,--workspace", workspace, "Host workspace directory")
        ->required()
        ->check(CLI::ExistingDirectory);
    run_cmd->add_option("-n,--name", tool_name, "Tool name for logs and labels");
    run_cmd->add_option("-i,--image", image, "Container image or E2B template");
    run_cmd->add_option("-t,--timeout", timeout_seconds, "Timeout in seconds")
        ->check(CLI::PositiveNumber);
    run_cmd->add_option("--cpu", cpu_limit, "CPU cores")->check(CLI::PositiveNumber);
    run_cmd->add_option("--memory", memory_mb, "Memory limit in MB")->check(CLI::PositiveNumber);
    run_cmd->add_flag("--no-network-isolation", no_network_isolation, "Use the shared bridge network");
    run_cmd->add_flag("--block-egress", block_egress, "Disable all network access");
    run_cmd->add_option("-o,--output", outputs, "Declared output file (repeatable)");
    run_cmd->add_option("-e,--env", env_pairs, "Environment variable KEY=VALUE (repeatable)");
    run_cmd->add_option("command", command_line, "Command and arguments (after --)")->required();

    // ---- tool ----
    auto* tool_cmd = app.add_subcommand("tool", "Run a catalog tool preset");
    std::string preset;
    std::vector<std::string> param_pairs;

    tool_cmd->add_option("name", preset, "Preset name")
        ->required()
        ->check(CLI::IsMember(core::ToolCatalog::Names()));
    tool_cmd->add_option("--scan-id", scan_id, "Scan identifier")->required();
    tool_cmd->add_option("-w,--workspace", workspace, "Host workspace directory")
        ->required()
        ->check(CLI::ExistingDirectory);
    tool_cmd->add_option("-P,--param", param_pairs, "Preset parameter KEY=VALUE (repeatable)");

    // ---- cleanup ----
    auto* cleanup_cmd = app.add_subcommand("cleanup", "Release every resource of a scan");
    cleanup_cmd->add_option("--scan-id", scan_id, "Scan identifier")->required();

    // ---- health ----
    auto* health_cmd = app.add_subcommand("health", "Check backend reachability and credentials");

    CLI11_PARSE(app, argc, argv);

    sigset_t blocked = SignalWatcher::BlockedSignals();
    pthread_sigmask(SIG_BLOCK, &blocked, nullptr);

    // Configure logging level and format
    spdlog::set_default_logger(spdlog::stderr_color_mt("threatweaver"));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    core::SandboxConfig config;
    std::unique_ptr<core::SandboxProvider> provider;
    try {
        config = LoadConfig(config_file, provider_name);
        provider = core::CreateSandboxProvider(config);
    } catch (const core::ConfigurationError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return kExitConfiguration;
    } catch (const core::ProviderUnavailableError& e) {
        spdlog::error("Backend unavailable: {}", e.what());
        return kExitConfiguration;
    }

    try {
        if (*health_cmd) {
            bool healthy = provider->HealthCheck();
            std::cout << (healthy ? "healthy" : "unhealthy") << std::endl;
            return healthy ? kExitSuccess : kExitExecutionFault;
        }

        if (*cleanup_cmd) {
            auto report = provider->Cleanup(scan_id);
            std::cout << report.ToJson() << std::endl;
            return report.Clean() ? kExitSuccess : kExitExecutionFault;
        }

        if (*tool_cmd) {
            core::ToolParams params;
            for (const auto& pair : param_pairs) {
                params.insert(SplitAssignment(pair, "--param"));
            }
            auto spec = core::ToolCatalog::Build(preset, params);
            return RunInvocation(*provider, spec, workspace, scan_id);
        }

        core::ToolInvocationBuilder builder(tool_name);
        builder.WithImage(image)
            .WithCommand(command_line.front())
            .WithArgs(std::vector<std::string>(command_line.begin() + 1, command_line.end()))
            .WithNetworkIsolation(!no_network_isolation)
            .WithBlockedEgress(block_egress)
            .WithTimeout(timeout_seconds > 0 ? std::chrono::seconds(timeout_seconds) : config.timeout)
            .WithCpuLimit(cpu_limit > 0.0 ? cpu_limit : config.cpu_limit)
            .WithMemoryLimit(memory_mb > 0 ? memory_mb : config.memory_limit_mb);
        for (const auto& path : outputs) {
            builder.DeclareOutput(path);
        }
        for (const auto& pair : env_pairs) {
            auto [name, value] = SplitAssignment(pair, "--env");
            builder.WithEnv(name, value);
        }
        return RunInvocation(*provider, builder.Build(), workspace, scan_id);

    } catch (const std::invalid_argument& e) {
        spdlog::error("Invalid invocation: {}", e.what());
        return kExitConfiguration;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kExitExecutionFault;
    }
}
