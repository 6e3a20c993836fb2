/**
 * @file threaded_application.cpp
 * @brief ThreadedApplication implementation
 */

#include "cursers/threaded_application.hpp"

#include <exception>
#include <string>
#include <utility>

#include "cursers/errors.hpp"
#include "cursers/log.hpp"
#include "cursers/paced_loop.hpp"

namespace cursers {

namespace {
constexpr const char *kComponent = "ThreadedApplication";
} // namespace

ThreadedApplication::ThreadedApplication(Terminal &terminal, Hooks hooks, AppConfig config)
    : app_(terminal, std::move(hooks), config), worker_([this] { update_loop(); }, "UpdateWorker") {}

ThreadedApplication::~ThreadedApplication() {
    if (exited_ || worker_.state() == WorkerState::NotStarted) {
        return;
    }
    try {
        exit();
    } catch (const std::exception &e) {
        log(LogLevel::Error, kComponent, std::string("exit failed during destruction: ") + e.what());
    }
}

void ThreadedApplication::enter() {
    if (worker_.state() != WorkerState::NotStarted || exited_) {
        throw InvalidState("threaded application entered twice");
    }

    app_.enter();

    try {
        worker_.enter();
    } catch (...) {
        // Entered but the loop never started; tear down as a normal exit
        exited_ = true;
        try {
            app_.exit();
        } catch (const std::exception &e) {
            log(LogLevel::Error, kComponent,
                std::string("on_exit failed after the worker could not start: ") + e.what());
        }
        throw;
    }
}

void ThreadedApplication::exit() {
    if (exited_) {
        return;
    }
    require_started("exit");
    exited_ = true;

    app_.request_exit();
    std::exception_ptr loop_error = worker_.join();

    // The worker is gone, so the screen belongs to this thread again
    try {
        app_.exit();
    } catch (...) {
        if (!loop_error) {
            throw;
        }
        log(LogLevel::Error, kComponent,
            "on_exit failed after the update loop had failed: " + describe(std::current_exception()));
    }

    if (loop_error) {
        std::rethrow_exception(loop_error);
    }
}

void ThreadedApplication::wait() {
    require_started("wait");
    worker_.wait();
}

bool ThreadedApplication::wait_for(std::chrono::steady_clock::duration timeout) {
    require_started("wait_for");
    return worker_.wait_for(timeout);
}

void ThreadedApplication::run(const std::function<void(ThreadedApplication &)> &body) {
    enter();
    try {
        body(*this);
    } catch (...) {
        try {
            exit();
        } catch (const std::exception &e) {
            log(LogLevel::Error, kComponent,
                std::string("exit failed while unwinding an earlier error: ") + e.what());
        }
        throw;
    }
    exit();
}

WorkerState ThreadedApplication::worker_state() const {
    WorkerState state = worker_.state();
    if (state == WorkerState::Running && app_.is_exit_requested()) {
        return WorkerState::Stopping;
    }
    return state;
}

void ThreadedApplication::update_loop() {
    app_.bind_update_thread();
    PacedLoop loop(app_.frame_budget(), app_.exit_signal());
    try {
        stats_ = loop.run([this] { app_.update(); });
    } catch (...) {
        if (app_.config().stop_on_error) {
            app_.request_exit();
        }
        throw;
    }
}

void ThreadedApplication::require_started(const char *operation) const {
    if (worker_.state() == WorkerState::NotStarted) {
        throw InvalidState(std::string(operation) + "() called before enter()");
    }
}

} // namespace cursers
