/**
 * @file threaded_application.hpp
 * @brief Application whose update loop runs on a worker thread
 *
 * enter() sets up the screen and runs on_enter on the calling thread, then
 * starts a Worker that runs the paced update loop. The calling thread is
 * free until exit(), which requests exit, joins the worker and only then
 * runs on_exit and releases the screen. on_exit therefore never overlaps
 * an on_update call.
 *
 * While the worker runs, the screen belongs to it. The inner Application is
 * reachable only through the hooks, and update() is bound to the worker
 * thread; hooks stop the loop with request_exit(), never exit().
 */

#pragma once

#include <chrono>
#include <functional>

#include "cursers/application.hpp"
#include "cursers/worker.hpp"

namespace cursers {

class ThreadedApplication {
  public:
    /**
     * @brief Construct a threaded application
     * @param terminal Terminal collaborator; must outlive the application
     * @param hooks Lifecycle hooks; on_update runs on the worker thread
     * @param config Rate, terminal options and stop_on_error
     * @throws ConfigError if config.fps is not positive
     */
    ThreadedApplication(Terminal &terminal, Hooks hooks, AppConfig config = {});

    /**
     * @brief Runs exit() if the worker was started and exit() has not run
     */
    ~ThreadedApplication();

    ThreadedApplication(const ThreadedApplication &) = delete;
    ThreadedApplication &operator=(const ThreadedApplication &) = delete;

    /**
     * @brief Acquire the screen, run on_enter and start the update loop
     * @throws ResourceUnavailable if the screen cannot be acquired
     * @throws InvalidState if already entered
     *
     * Returns once the worker thread exists, without waiting for a tick.
     */
    void enter();

    /**
     * @brief Stop the loop, join the worker, run on_exit, release the screen
     *
     * Blocks until the in-flight tick (if any) completes. An exception from
     * the update loop is rethrown after the screen has been released. Runs
     * once; later calls are no-ops.
     */
    void exit();

    // Callable from any thread, including on_update
    void request_exit() noexcept {
        app_.request_exit();
    }

    bool is_exit_requested() const noexcept {
        return app_.is_exit_requested();
    }

    /**
     * @brief Block until the update loop has ended
     * @throws InvalidState if the application was never entered
     */
    void wait();

    /**
     * @brief Block until the update loop has ended or the timeout expires
     * @return bool True if the loop has ended
     * @throws InvalidState if the application was never entered
     */
    bool wait_for(std::chrono::steady_clock::duration timeout);

    /**
     * @brief Whether the update loop ended with an exception
     *
     * The exception itself is rethrown by exit().
     */
    bool worker_failed() const {
        return worker_.failed();
    }

    /**
     * @brief enter(), body(*this), exit(), with exit() on every path
     */
    void run(const std::function<void(ThreadedApplication &)> &body);

    /**
     * @brief Worker state, reporting Stopping once exit has been requested
     */
    WorkerState worker_state() const;

    AppState state() const {
        return app_.state();
    }

    const AppConfig &config() const {
        return app_.config();
    }

    /**
     * @brief Counters from the update loop; meaningful after exit()
     */
    const LoopStats &loop_stats() const {
        return stats_;
    }

  private:
    void update_loop();
    void require_started(const char *operation) const;

    Application app_;
    LoopStats stats_;
    bool exited_{false};
    Worker worker_; ///< Declared last so it is joined before app_ is destroyed
};

} // namespace cursers
