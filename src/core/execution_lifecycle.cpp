/**
 * @file execution_lifecycle.cpp
 * @brief Transition table for ExecutionLifecycle
 *
 * @date 2025
 */

#include "threatweaver/core/execution_lifecycle.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace threatweaver {
namespace core {

std::string ExecutionStateToString(ExecutionState state) {
    switch (state) {
        case ExecutionState::PENDING:      return "PENDING";
        case ExecutionState::PROVISIONING: return "PROVISIONING";
        case ExecutionState::RUNNING:      return "RUNNING";
        case ExecutionState::SUCCEEDED:    return "SUCCEEDED";
        case ExecutionState::FAILED:       return "FAILED";
        case ExecutionState::TIMED_OUT:    return "TIMED_OUT";
        case ExecutionState::CLEANED_UP:   return "CLEANED_UP";
    }
    return "UNKNOWN";
}

bool IsOutcomeState(ExecutionState state) {
    return state == ExecutionState::SUCCEEDED ||
           state == ExecutionState::FAILED ||
           state == ExecutionState::TIMED_OUT;
}

ExecutionLifecycle::ExecutionLifecycle()
    : created_at_(std::chrono::system_clock::now()) {}

bool ExecutionLifecycle::IsAllowed(ExecutionState from, ExecutionState to) {
    switch (from) {
        case ExecutionState::PENDING:
            return to == ExecutionState::PROVISIONING;
        case ExecutionState::PROVISIONING:
            return to == ExecutionState::RUNNING || to == ExecutionState::FAILED;
        case ExecutionState::RUNNING:
            return IsOutcomeState(to);
        case ExecutionState::SUCCEEDED:
        case ExecutionState::FAILED:
        case ExecutionState::TIMED_OUT:
            return to == ExecutionState::CLEANED_UP;
        case ExecutionState::CLEANED_UP:
            return false;
    }
    return false;
}

void ExecutionLifecycle::TransitionTo(ExecutionState next) {
    if (!IsAllowed(state_, next)) {
        throw std::logic_error("illegal execution state transition " +
                               ExecutionStateToString(state_) + " -> " +
                               ExecutionStateToString(next));
    }

    history_.push_back(StateTransition{state_, next, std::chrono::system_clock::now()});
    spdlog::debug("Execution state {} -> {}",
                  ExecutionStateToString(state_), ExecutionStateToString(next));
    state_ = next;
}

bool ExecutionLifecycle::EnteredAt(ExecutionState state,
                                   std::chrono::system_clock::time_point& at) const {
    if (state == ExecutionState::PENDING) {
        at = created_at_;
        return true;
    }
    for (const auto& transition : history_) {
        if (transition.to == state) {
            at = transition.at;
            return true;
        }
    }
    return false;
}

} // namespace core
} // namespace threatweaver
