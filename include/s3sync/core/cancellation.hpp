#pragma once

#include <atomic>

namespace s3sync {

/**
 * @brief Cooperative cancellation flag shared between an initiator and workers
 *
 * THREAD SAFETY:
 * - cancel() may be called from any thread (e.g. a signal handler thread)
 * - Workers poll is_cancelled() at their own suspension points
 */
class CancellationToken {
public:
    CancellationToken() = default;

    // Non-copyable (workers hold references to the initiator's token)
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace s3sync
