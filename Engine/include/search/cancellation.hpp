/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation for long-running searches
 */

#pragma once

#include <atomic>
#include <chrono>
#include <optional>

namespace Annex {

/**
 * @brief Token passed into search calls to bound worst-case latency
 *
 * Searches poll the token between query rows and periodically inside tree
 * traversals. A token trips either through cancel() or once its deadline
 * passes. The deadline must be set before the token is shared.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    explicit CancellationToken(std::chrono::milliseconds timeout)
        : deadline_(Clock::now() + timeout) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept {
        cancelled_.store(true, std::memory_order_release);
    }

    bool is_cancelled() const noexcept {
        if (cancelled_.load(std::memory_order_acquire)) return true;
        if (deadline_ && Clock::now() >= *deadline_) {
            cancelled_.store(true, std::memory_order_release);
            return true;
        }
        return false;
    }

private:
    mutable std::atomic<bool> cancelled_{false};
    std::optional<Clock::time_point> deadline_;
};

} // namespace Annex
