/**
 * @file paced_loop.cpp
 * @brief PacedLoop implementation
 */

#include "cursers/paced_loop.hpp"

#include <thread>
#include <utility>

namespace cursers {

PacedLoop::PacedLoop(FrameBudget budget, const ExitSignal &signal)
    : PacedLoop(
          budget, signal, [] { return Clock::now(); },
          [](FrameBudget::Duration d) { std::this_thread::sleep_for(d); }) {}

PacedLoop::PacedLoop(FrameBudget budget, const ExitSignal &signal, NowFunction now,
                     SleepFunction sleep)
    : budget_(budget), signal_(signal), now_(std::move(now)), sleep_(std::move(sleep)) {}

LoopStats PacedLoop::run(const std::function<void()> &tick) {
    LoopStats stats;
    const FrameBudget::Duration frame = budget_.frame_duration();

    while (!signal_.is_requested()) {
        const Clock::time_point start = now_();
        tick();
        ++stats.ticks;

        if (signal_.is_requested()) {
            break;
        }

        FrameBudget::Duration elapsed = now_() - start;
        if (elapsed >= frame) {
            ++stats.overruns;
            continue;
        }
        sleep_(frame - elapsed);
    }

    return stats;
}

} // namespace cursers
