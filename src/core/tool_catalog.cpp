/**
 * @file tool_catalog.cpp
 * @brief Tool preset definitions
 *
 * @date 2025
 */

#include "threatweaver/core/tool_catalog.hpp"
#include "threatweaver/utils/string_utils.hpp"

#include <chrono>
#include <functional>
#include <stdexcept>

namespace threatweaver {
namespace core {

namespace {

using PresetFactory = std::function<ToolInvocationSpec(const ToolParams&)>;

struct Preset {
    std::vector<std::string> params;
    PresetFactory build;
};

const std::map<std::string, Preset>& Presets() {
    static const std::map<std::string, Preset> presets = {
        {"subfinder", {{"domain", "output_file"}, [](const ToolParams& p) {
            return ToolInvocationBuilder("subfinder")
                .WithImage("projectdiscovery/subfinder:latest")
                .WithCommand("subfinder")
                .WithArgs({"-d", p.at("domain"), "-o", p.at("output_file"), "-silent"})
                .WithTimeout(std::chrono::minutes(30))
                .WithCpuLimit(1.0)
                .WithMemoryLimit(1024)
                .DeclareOutput(p.at("output_file"))
                .Build();
        }}},
        {"httpx", {{"input_file", "output_file"}, [](const ToolParams& p) {
            return ToolInvocationBuilder("httpx")
                .WithImage("projectdiscovery/httpx:latest")
                .WithCommand("httpx")
                .WithArgs({"-l", p.at("input_file"), "-o", p.at("output_file"),
                           "-json", "-silent", "-tech-detect", "-status-code"})
                .WithTimeout(std::chrono::minutes(30))
                .WithCpuLimit(2.0)
                .WithMemoryLimit(2048)
                .DeclareOutput(p.at("output_file"))
                .Build();
        }}},
        {"nmap", {{"target", "output_file"}, [](const ToolParams& p) {
            return ToolInvocationBuilder("nmap")
                .WithImage("instrumentisto/nmap:latest")
                .WithCommand("nmap")
                .WithArgs({"-sV", "-sC", "-T4",
                           "-oX", p.at("output_file"),
                           "--max-retries", "2",
                           "--host-timeout", "30m",
                           p.at("target")})
                .WithTimeout(std::chrono::hours(1))
                .WithCpuLimit(2.0)
                .WithMemoryLimit(2048)
                .DeclareOutput(p.at("output_file"))
                .Build();
        }}},
        {"nuclei", {{"target_file", "output_file"}, [](const ToolParams& p) {
            // Template matching is memory hungry
            return ToolInvocationBuilder("nuclei")
                .WithImage("projectdiscovery/nuclei:latest")
                .WithCommand("nuclei")
                .WithArgs({"-l", p.at("target_file"), "-o", p.at("output_file"),
                           "-json", "-silent", "-severity", "critical,high,medium"})
                .WithTimeout(std::chrono::hours(1))
                .WithCpuLimit(2.0)
                .WithMemoryLimit(4096)
                .DeclareOutput(p.at("output_file"))
                .Build();
        }}},
        {"sqlmap", {{"target_url", "output_dir"}, [](const ToolParams& p) {
            return ToolInvocationBuilder("sqlmap")
                .WithImage("pberba/sqlmap:latest")
                .WithCommand("sqlmap")
                .WithArgs({"-u", p.at("target_url"), "--batch", "--random-agent",
                           "--output-dir", p.at("output_dir"), "--dump", "--threads", "5"})
                .WithTimeout(std::chrono::hours(1))
                .WithCpuLimit(2.0)
                .WithMemoryLimit(2048)
                .WithNetworkIsolation(false)
                .Build();
        }}},
    };
    return presets;
}

const Preset& FindPreset(const std::string& tool) {
    auto it = Presets().find(tool);
    if (it == Presets().end()) {
        throw std::invalid_argument("unknown tool '" + tool + "' (available: " +
                                    utils::StringUtils::Join(ToolCatalog::Names(), ", ") + ")");
    }
    return it->second;
}

} // anonymous namespace

std::vector<std::string> ToolCatalog::Names() {
    std::vector<std::string> names;
    for (const auto& entry : Presets()) {
        names.push_back(entry.first);
    }
    return names;
}

std::vector<std::string> ToolCatalog::RequiredParams(const std::string& tool) {
    return FindPreset(tool).params;
}

ToolInvocationSpec ToolCatalog::Build(const std::string& tool, const ToolParams& params) {
    const Preset& preset = FindPreset(tool);

    for (const auto& name : preset.params) {
        auto it = params.find(name);
        if (it == params.end() || it->second.empty()) {
            throw std::invalid_argument("tool '" + tool + "' requires parameter '" + name + "'");
        }
    }
    return preset.build(params);
}

} // namespace core
} // namespace threatweaver
