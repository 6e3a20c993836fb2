/**
 * @file exit_signal.hpp
 * @brief Cross-thread "exit requested" latch
 */

#pragma once

#include <atomic>

namespace cursers {

/**
 * @brief One-way boolean latch shared by the worker and controlling threads
 *
 * Starts false. request_exit() sets it and it stays set. Both operations
 * use sequentially consistent atomics, so a request that completed before a
 * read began is always observed by that read. Non-copyable.
 */
class ExitSignal {
  public:
    ExitSignal() = default;

    ExitSignal(const ExitSignal &) = delete;
    ExitSignal &operator=(const ExitSignal &) = delete;

    // Idempotent; callable from any thread
    void request_exit() noexcept {
        requested_.store(true, std::memory_order_seq_cst);
    }

    bool is_requested() const noexcept {
        return requested_.load(std::memory_order_seq_cst);
    }

  private:
    std::atomic<bool> requested_{false};
};

} // namespace cursers
