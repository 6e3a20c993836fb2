/**
 * @file paced_loop.hpp
 * @brief Fixed-rate tick loop with best-effort pacing
 *
 * Each iteration checks the exit signal, runs one tick, then sleeps for
 * whatever is left of the frame budget. A tick that overruns its budget is
 * followed immediately by the next one; lost time is never caught up.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "cursers/config.hpp"
#include "cursers/exit_signal.hpp"

namespace cursers {

/**
 * @brief Counters reported when a loop ends normally
 */
struct LoopStats {
    std::uint64_t ticks = 0;    ///< Ticks that ran to completion
    std::uint64_t overruns = 0; ///< Ticks that used the whole budget or more
};

class PacedLoop {
  public:
    using Clock = std::chrono::steady_clock;
    using NowFunction = std::function<Clock::time_point()>;
    using SleepFunction = std::function<void(FrameBudget::Duration)>;

    /**
     * @brief Loop on the steady clock with real sleeps
     * @param budget Frame budget
     * @param signal Signal checked before every tick; must outlive the loop
     */
    PacedLoop(FrameBudget budget, const ExitSignal &signal);

    /**
     * @brief Loop with an injected clock and sleep, for deterministic timing
     */
    PacedLoop(FrameBudget budget, const ExitSignal &signal, NowFunction now, SleepFunction sleep);

    /**
     * @brief Run ticks until the exit signal is observed
     * @param tick Work for one frame
     * @return LoopStats Counters for the completed run
     *
     * The signal is checked at the top of every iteration, so a tick that is
     * in flight when exit is requested always completes and no further tick
     * starts. The remainder sleep is skipped once exit has been requested.
     * Exceptions from tick propagate and end the loop.
     */
    LoopStats run(const std::function<void()> &tick);

    const FrameBudget &budget() const {
        return budget_;
    }

  private:
    FrameBudget budget_;
    const ExitSignal &signal_;
    NowFunction now_;
    SleepFunction sleep_;
};

} // namespace cursers
