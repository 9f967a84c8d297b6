/**
 * @file execution_lifecycle.hpp
 * @brief State machine of a single sandboxed execution
 *
 * ```
 * PENDING -> PROVISIONING -> RUNNING -> SUCCEEDED | FAILED | TIMED_OUT -> CLEANED_UP
 *                 |                                  ^
 *                 +---------- setup failure ---------+
 * ```
 *
 * Every backend drives one ExecutionLifecycle per Execute() call. States
 * are never re-entered and CLEANED_UP is terminal.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace threatweaver {
namespace core {

/**
 * @enum ExecutionState
 * @brief Lifecycle states of an execution
 */
enum class ExecutionState {
    PENDING,       ///< Accepted, nothing allocated yet
    PROVISIONING,  ///< Creating sandbox, network and workspace
    RUNNING,       ///< Tool process alive; timeout clock authoritative
    SUCCEEDED,     ///< Exited with status 0
    FAILED,        ///< Non-zero exit, setup failure, cancellation or backend fault
    TIMED_OUT,     ///< Deadline passed and the sandbox was killed
    CLEANED_UP     ///< Backend resources released
};

std::string ExecutionStateToString(ExecutionState state);

/// True for SUCCEEDED, FAILED and TIMED_OUT.
bool IsOutcomeState(ExecutionState state);

/**
 * @struct StateTransition
 * @brief One recorded state change
 */
struct StateTransition {
    ExecutionState from;
    ExecutionState to;
    std::chrono::system_clock::time_point at;
};

/**
 * @class ExecutionLifecycle
 * @brief Enforces legal state transitions and keeps their history
 *
 * Not thread-safe; owned by the thread running the execution.
 */
class ExecutionLifecycle {
public:
    ExecutionLifecycle();

    ExecutionState State() const { return state_; }

    /**
     * @brief Move to a new state
     * @throws std::logic_error if the transition is not allowed
     */
    void TransitionTo(ExecutionState next);

    static bool IsAllowed(ExecutionState from, ExecutionState to);

    const std::vector<StateTransition>& History() const { return history_; }

    /// Time at which the given state was entered, if it was.
    bool EnteredAt(ExecutionState state, std::chrono::system_clock::time_point& at) const;

    bool IsTerminal() const { return state_ == ExecutionState::CLEANED_UP; }

private:
    ExecutionState state_{ExecutionState::PENDING};
    std::chrono::system_clock::time_point created_at_;
    std::vector<StateTransition> history_;
};

} // namespace core
} // namespace threatweaver
