/**
 * @file tool_catalog.hpp
 * @brief Ready-made invocations for the reconnaissance and assessment tools
 *
 * Each preset pins the tool's container image, its non-interactive
 * arguments and resource limits sized for the tool. Paths are passed through
 * unchanged and resolved by the tool relative to /workspace, its working
 * directory.
 *
 * | Tool      | Parameters                 | Timeout | CPU | Memory  |
 * |-----------|----------------------------|---------|-----|---------|
 * | subfinder | domain, output_file        | 30 min  | 1   | 1024 MB |
 * | httpx     | input_file, output_file    | 30 min  | 2   | 2048 MB |
 * | nmap      | target, output_file        | 60 min  | 2   | 2048 MB |
 * | nuclei    | target_file, output_file   | 60 min  | 2   | 4096 MB |
 * | sqlmap    | target_url, output_dir     | 60 min  | 2   | 2048 MB |
 *
 * sqlmap runs without a per-scan network so it can reach the target
 * application directly.
 *
 * @date 2025
 */

#pragma once

#include "threatweaver/core/tool_invocation.hpp"

#include <map>
#include <string>
#include <vector>

namespace threatweaver {
namespace core {

/// Named preset parameters, e.g. {"domain": "example.com"}.
using ToolParams = std::map<std::string, std::string>;

class ToolCatalog {
public:
    /// Names of all presets, sorted.
    static std::vector<std::string> Names();

    /**
     * @brief Parameters a preset requires
     * @throws std::invalid_argument for an unknown tool
     */
    static std::vector<std::string> RequiredParams(const std::string& tool);

    /**
     * @brief Build the invocation for a preset
     * @param tool Preset name
     * @param params Values for every required parameter; extras are ignored
     * @throws std::invalid_argument for an unknown tool or a missing parameter
     */
    static ToolInvocationSpec Build(const std::string& tool, const ToolParams& params);
};

} // namespace core
} // namespace threatweaver
