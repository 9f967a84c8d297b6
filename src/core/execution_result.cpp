/**
 * @file execution_result.cpp
 * @brief Outcome classification and JSON serialisation of results
 *
 * @date 2025
 */

#include "threatweaver/core/execution_result.hpp"
#include "threatweaver/core/tool_invocation.hpp"
#include "threatweaver/utils/string_utils.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace threatweaver {
namespace core {

using utils::StringUtils;

namespace {

/// Bytes of stderr quoted in a non-zero exit diagnostic.
constexpr std::size_t kStderrExcerptBytes = 512;

} // anonymous namespace

std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kTimeout:   return "timeout";
        case ErrorKind::kResource:  return "resource";
        case ErrorKind::kExecution: return "execution";
    }
    return "unknown";
}

// ============================================================================
// OUTCOME CLASSIFICATION
// ============================================================================

ExecutionState ClassifyOutcome(const RunObservation& observation,
                               const ToolInvocationSpec& spec,
                               SandboxExecutionResult& result) {
    result.success = false;
    result.error.reset();

    if (!observation.provisioned) {
        result.exit_code = kNoExitCode;
        result.error = SandboxError{ErrorKind::kExecution,
                                    "setup failure: " + observation.setup_error};
        result.outcome = ExecutionState::FAILED;
        return result.outcome;
    }

    if (observation.timed_out) {
        result.exit_code = kNoExitCode;
        result.error = SandboxError{
            ErrorKind::kTimeout,
            "tool '" + spec.Name() + "' exceeded timeout of " +
                std::to_string(spec.Timeout().count()) + "s and was killed"};
        result.outcome = ExecutionState::TIMED_OUT;
        return result.outcome;
    }

    if (observation.cancelled) {
        result.exit_code = kNoExitCode;
        result.error = SandboxError{ErrorKind::kExecution,
                                    "execution of '" + spec.Name() + "' was cancelled"};
        result.outcome = ExecutionState::FAILED;
        return result.outcome;
    }

    if (observation.resource_killed) {
        std::size_t limit = observation.enforced_memory_mb != 0 ? observation.enforced_memory_mb
                                                                : spec.MemoryLimitMb();
        std::string message = "tool '" + spec.Name() + "' was killed for exceeding its memory limit of " +
                              std::to_string(limit) + " MB";
        if (!observation.resource_detail.empty()) {
            message += " (" + observation.resource_detail + ")";
        }
        result.exit_code = kNoExitCode;
        result.error = SandboxError{ErrorKind::kResource, message};
        result.outcome = ExecutionState::FAILED;
        return result.outcome;
    }

    result.exit_code = observation.exit_code;

    if (!observation.backend_error.empty()) {
        result.error = SandboxError{ErrorKind::kExecution,
                                    "backend error: " + observation.backend_error};
        result.outcome = ExecutionState::FAILED;
        return result.outcome;
    }

    if (observation.exit_code != 0) {
        std::string message = "tool '" + spec.Name() + "' exited with code " +
                              std::to_string(observation.exit_code);
        std::string excerpt = StringUtils::Trim(
            StringUtils::Tail(result.stderr_output, kStderrExcerptBytes));
        if (!excerpt.empty()) {
            message += ": " + StringUtils::Sanitize(excerpt);
        }
        result.error = SandboxError{ErrorKind::kExecution, message};
        result.outcome = ExecutionState::FAILED;
        return result.outcome;
    }

    result.success = true;
    result.outcome = ExecutionState::SUCCEEDED;
    return result.outcome;
}

// ============================================================================
// SERIALISATION
// ============================================================================

std::string SandboxExecutionResult::ToJson(int indent) const {
    json j;
    j["success"] = success;
    j["exit_code"] = exit_code;
    j["stdout"] = stdout_output;
    j["stderr"] = stderr_output;
    j["stdout_truncated"] = stdout_truncated;
    j["stderr_truncated"] = stderr_truncated;
    j["duration_ms"] = duration.count();
    j["output_files"] = output_files;
    j["truncated_output_files"] = truncated_output_files;
    j["outcome"] = ExecutionStateToString(outcome);
    j["sandbox_id"] = sandbox_id;
    j["teardown_errors"] = teardown_errors;

    if (error) {
        j["error"] = {
            {"kind", ErrorKindToString(error->kind)},
            {"message", error->message}
        };
    } else {
        j["error"] = nullptr;
    }

    // Tool output is arbitrary bytes; replace invalid UTF-8 instead of throwing.
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string CleanupReport::ToJson(int indent) const {
    json j = {
        {"scan_id", scan_id},
        {"released", released},
        {"failures", failures}
    };
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace core
} // namespace threatweaver
