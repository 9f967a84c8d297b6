/**
 * @file process_runner.hpp
 * @brief Host process execution with literal argv, streaming capture and deadlines
 *
 * The Docker backend drives the container runtime through its CLI. Every
 * CLI call goes through a ProcessRunner so that:
 * - arguments are passed as a vector to execve (no shell, no injection)
 * - stdout/stderr are drained incrementally into bounded buffers
 * - a wall-clock deadline and a cancellation token kill the whole process group
 *
 * The interface exists so tests can substitute a scripted runner.
 *
 * @date 2025
 */

#pragma once

#include "threatweaver/utils/cancellation_token.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace threatweaver {
namespace utils {

/**
 * @struct ProcessOptions
 * @brief Per-call execution controls
 */
struct ProcessOptions {
    std::chrono::milliseconds timeout{0};              ///< Deadline from spawn, 0 = none
    std::size_t max_output_bytes{10 * 1024 * 1024};    ///< Ceiling per stream
    std::map<std::string, std::string> environment;    ///< Added to the inherited environment
    std::filesystem::path working_directory;           ///< Empty = inherit
    CancellationToken cancel_token;                    ///< Kills the process when cancelled
    std::chrono::milliseconds poll_interval{50};       ///< Deadline/cancel check granularity
};

/**
 * @struct ProcessResult
 * @brief Outcome of one host process
 */
struct ProcessResult {
    int exit_code{-1};                 ///< Exit status, -1 if killed or never started
    int term_signal{0};                ///< Terminating signal, 0 if exited normally
    std::string stdout_output;         ///< Captured stdout (bounded)
    std::string stderr_output;         ///< Captured stderr (bounded)
    bool stdout_truncated{false};      ///< stdout exceeded max_output_bytes
    bool stderr_truncated{false};      ///< stderr exceeded max_output_bytes
    bool timed_out{false};             ///< Killed at the deadline
    bool cancelled{false};             ///< Killed because the token was cancelled
    bool spawn_failed{false};          ///< fork/exec failed
    std::string spawn_error;           ///< Reason for spawn failure
    std::chrono::milliseconds duration{0};  ///< Spawn to reap

    bool Succeeded() const {
        return !spawn_failed && !timed_out && !cancelled && term_signal == 0 && exit_code == 0;
    }
};

/**
 * @class ProcessRunner
 * @brief Abstract host process launcher
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Run argv[0] with argv as its literal argument vector
     *
     * Blocks until the process exits, the deadline passes, or the token is
     * cancelled. Never throws for process-level failures; those are
     * reported in the result.
     */
    virtual ProcessResult Run(const std::vector<std::string>& argv,
                              const ProcessOptions& options) = 0;
};

/**
 * @class PosixProcessRunner
 * @brief fork/execvpe implementation with poll()-based capture
 *
 * The child is placed in its own process group; timeouts and cancellation
 * deliver SIGKILL to the whole group so helpers it spawned die with it.
 * Thread-safe: holds no mutable state.
 */
class PosixProcessRunner : public ProcessRunner {
public:
    ProcessResult Run(const std::vector<std::string>& argv,
                      const ProcessOptions& options) override;

    /**
     * @brief Resolve a program name against PATH
     * @return Absolute path, or empty if not found or not executable
     */
    static std::filesystem::path FindExecutable(const std::string& program);
};

} // namespace utils
} // namespace threatweaver
