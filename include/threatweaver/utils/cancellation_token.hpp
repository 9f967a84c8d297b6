/**
 * @file cancellation_token.hpp
 * @brief Cooperative cancellation shared between a caller and an execution
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace threatweaver {
namespace utils {

/**
 * @class CancellationToken
 * @brief Copyable handle to a shared cancellation flag
 *
 * All copies observe the same flag. Cancelling is one-way: once set, the
 * flag never clears. Execution loops poll IsCancelled() or sleep through
 * WaitFor(), which wakes early on cancellation.
 *
 * **Usage Example**:
 * @code
 * CancellationToken token;
 * auto future = provider.ExecuteAsync(spec, workspace, "scan-42", token);
 * // ... caller context goes away
 * token.Cancel();   // sandbox is killed and torn down
 * @endcode
 */
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    /// Request cancellation; wakes every waiter.
    void Cancel() const {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled.store(true);
        }
        state_->cv.notify_all();
    }

    bool IsCancelled() const { return state_->cancelled.load(); }

    /**
     * @brief Sleep for up to the given duration
     * @return true if cancellation was requested before or during the wait
     */
    template <typename Rep, typename Period>
    bool WaitFor(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_for(lock, duration,
                                   [this] { return state_->cancelled.load(); });
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };

    std::shared_ptr<State> state_;
};

} // namespace utils
} // namespace threatweaver
