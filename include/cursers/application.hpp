/**
 * @file application.hpp
 * @brief Synchronous application lifecycle
 *
 * An Application owns a ScreenSession and an ExitSignal and drives three
 * optional hooks:
 *
 *   enter()   acquire the screen, run on_enter
 *   update()  read one key, run on_update, refresh
 *   exit()    run on_exit, release the screen
 *
 * exit() runs exactly once, on every path: explicit request, a failing
 * hook or the end of the caller's loop. The terminal is always usable again
 * by the time an error reaches the caller.
 */

#pragma once

#include <atomic>
#include <functional>
#include <optional>
#include <thread>

#include "cursers/config.hpp"
#include "cursers/exit_signal.hpp"
#include "cursers/paced_loop.hpp"
#include "cursers/screen_session.hpp"
#include "cursers/terminal.hpp"

namespace cursers {

class Application;

/**
 * @brief Lifecycle hooks; an empty hook is a no-op
 */
struct Hooks {
    std::function<void(Application &app)> on_enter;
    std::function<void(Application &app, std::optional<KeyCode> key)> on_update;
    std::function<void(Application &app)> on_exit;
};

enum class AppState { Created, Entered, Running, Exited };

const char *to_string(AppState state);

/**
 * @brief Screen lifecycle with caller-driven updates
 *
 * All calls except request_exit()/is_exit_requested() belong to the thread
 * that owns the application. Non-copyable, single-use.
 */
class Application {
  public:
    /**
     * @brief Construct an application
     * @param terminal Terminal collaborator; must outlive the application
     * @param hooks Lifecycle hooks
     * @param config Rate and terminal options
     * @throws ConfigError if config.fps is not positive
     */
    Application(Terminal &terminal, Hooks hooks, AppConfig config = {});

    /**
     * @brief Runs exit() if the application is still entered
     */
    ~Application();

    Application(const Application &) = delete;
    Application &operator=(const Application &) = delete;

    /**
     * @brief Acquire the screen and run on_enter
     * @throws ResourceUnavailable if the screen cannot be acquired (no hook runs)
     * @throws InvalidState unless the application is in Created
     *
     * If on_enter throws, the screen is released, the application becomes
     * Exited and the exception propagates. on_exit is not run in that case.
     */
    void enter();

    /**
     * @brief Run one tick
     * @return bool True if a tick ran, false if exit was already requested
     * @throws InvalidState unless the application is Entered or Running
     *
     * Reads one key (or nullopt), passes it to on_update, then refreshes.
     * Hook exceptions propagate; the application stays entered so that
     * exit() still tears it down. A second update() while a tick is in
     * flight, or one from a thread other than the bound update thread,
     * throws InvalidState without running the hook.
     */
    bool update();

    /**
     * @brief Run on_exit and release the screen
     * @throws InvalidState if the application was never entered
     *
     * @throws InvalidState if called while a tick is in flight (hooks use
     *         request_exit() instead)
     *
     * The screen is released even when on_exit throws; the exception then
     * propagates. Calling exit() again after it has run is a no-op.
     */
    void exit();

    /**
     * @brief Reserve update() for the calling thread
     *
     * ThreadedApplication binds its worker so that no other thread can tick
     * the application while the loop owns the screen.
     */
    void bind_update_thread() {
        update_thread_.store(std::this_thread::get_id());
    }

    void request_exit() noexcept {
        exit_signal_.request_exit();
    }

    bool is_exit_requested() const noexcept {
        return exit_signal_.is_requested();
    }

    /**
     * @brief enter(), body(*this), exit(), with exit() on every path
     */
    void run(const std::function<void(Application &)> &body);

    /**
     * @brief enter(), paced update() until exit is requested, exit()
     * @return LoopStats Counters from the update loop
     */
    LoopStats run_paced();

    /**
     * @brief Screen for drawing from hooks
     * @throws InvalidState unless Entered or Running
     */
    ScreenSession &screen();

    AppState state() const {
        return state_.load();
    }

    const AppConfig &config() const {
        return config_;
    }

    const FrameBudget &frame_budget() const {
        return budget_;
    }

    ExitSignal &exit_signal() {
        return exit_signal_;
    }

  private:
    bool is_entered() const;

    AppConfig config_;
    FrameBudget budget_;
    Hooks hooks_;
    ScreenSession session_;
    ExitSignal exit_signal_;
    std::atomic<AppState> state_{AppState::Created};
    bool exiting_{false}; ///< Set while on_exit runs
    std::atomic<bool> ticking_{false};
    std::atomic<std::thread::id> update_thread_{};
};

} // namespace cursers
