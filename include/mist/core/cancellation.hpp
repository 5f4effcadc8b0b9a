#pragma once

#include <atomic>

namespace mist {

/**
 * @brief Cooperative cancellation flag shared by the orchestrator, the
 *        encryption gateway and the process runner
 *
 * request() is async-signal-safe so it can be called from a SIGINT handler.
 */
class CancellationToken {
public:
    void request() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    void reset() noexcept { cancelled_.store(false, std::memory_order_relaxed); }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Route SIGINT and SIGTERM to `token`
 *
 * Only one token can be installed per process; a later call replaces the
 * earlier one.
 */
void install_interrupt_handler(CancellationToken& token);

} // namespace mist
