/**
 * @file execution_result.hpp
 * @brief Outcome of a sandboxed execution and its error taxonomy
 *
 * Backends never let their own error types cross the provider contract.
 * Whatever went wrong is folded into one of three ErrorKind values carried
 * on the result, together with the best diagnostic the backend had.
 *
 * @date 2025
 */

#pragma once

#include "threatweaver/core/execution_lifecycle.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace threatweaver {
namespace core {

class ToolInvocationSpec;

/**
 * @enum ErrorKind
 * @brief Closed set of failure categories
 */
enum class ErrorKind {
    kTimeout,    ///< Deadline exceeded; sandbox was killed
    kResource,   ///< Memory or other hard ceiling hit
    kExecution   ///< Setup failure, non-zero exit, cancellation, backend fault
};

std::string ErrorKindToString(ErrorKind kind);

/**
 * @struct SandboxError
 * @brief Failure category plus human-readable diagnostic
 */
struct SandboxError {
    ErrorKind kind{ErrorKind::kExecution};
    std::string message;
};

/// Exit code reported when the process never produced one.
constexpr int kNoExitCode = -1;

/**
 * @struct SandboxExecutionResult
 * @brief Everything observed about one Execute() call
 *
 * success is true iff the tool exited with status 0 and no backend fault
 * occurred; error is present iff success is false.
 */
struct SandboxExecutionResult {
    bool success{false};                              ///< Ran to completion with exit 0
    int exit_code{kNoExitCode};                       ///< Process exit status
    std::string stdout_output;                        ///< Captured stdout (bounded)
    std::string stderr_output;                        ///< Captured stderr (bounded)
    bool stdout_truncated{false};                     ///< stdout hit the ceiling
    bool stderr_truncated{false};                     ///< stderr hit the ceiling
    std::chrono::milliseconds duration{0};            ///< Sandbox ready to process end
    std::map<std::string, std::string> output_files;  ///< Declared path -> contents
    std::vector<std::string> truncated_output_files;  ///< Files cut at the per-file ceiling
    std::optional<SandboxError> error;                ///< Present iff !success

    ExecutionState outcome{ExecutionState::PENDING};  ///< SUCCEEDED, FAILED or TIMED_OUT
    std::string sandbox_id;                           ///< Backend handle, for diagnostics
    std::vector<std::string> teardown_errors;         ///< Release failures at end of call

    /// Serialise to a JSON document.
    std::string ToJson(int indent = 2) const;
};

/**
 * @struct RunObservation
 * @brief Raw facts a backend gathered about a run
 *
 * Both backends fill one of these and hand it to ClassifyOutcome() so that
 * identical situations are reported identically regardless of backend.
 */
struct RunObservation {
    bool provisioned{false};      ///< Sandbox was created and the process started
    std::string setup_error;      ///< Why provisioning failed
    bool timed_out{false};        ///< Deadline passed
    bool cancelled{false};        ///< Caller cancelled the token
    bool resource_killed{false};  ///< Killed by a resource ceiling (OOM)
    std::string resource_detail;  ///< Backend wording for the resource kill
    std::size_t enforced_memory_mb{0};  ///< Memory ceiling the backend applied; 0 = the invocation's
    std::string backend_error;    ///< Unexpected backend failure while running
    int exit_code{kNoExitCode};   ///< Process exit status if one was observed
};

/**
 * @brief Turn a backend observation into the result's outcome fields
 *
 * Sets success, exit_code (forced to kNoExitCode for timeouts, resource
 * kills and setup failures), error and outcome. Precedence: setup failure,
 * timeout, cancellation, resource kill, backend error, non-zero exit.
 *
 * @param observation What the backend saw
 * @param spec Invocation, for diagnostics
 * @param result Result to update; stderr_output must already be filled
 * @return The terminal lifecycle state to enter
 */
ExecutionState ClassifyOutcome(const RunObservation& observation,
                               const ToolInvocationSpec& spec,
                               SandboxExecutionResult& result);

/**
 * @struct CleanupReport
 * @brief Result of SandboxProvider::Cleanup()
 */
struct CleanupReport {
    std::string scan_id;
    std::size_t released{0};            ///< Resources removed by this call
    std::vector<std::string> failures;  ///< Removal failures, already logged

    bool Clean() const { return failures.empty(); }

    std::string ToJson(int indent = 2) const;
};

} // namespace core
} // namespace threatweaver
