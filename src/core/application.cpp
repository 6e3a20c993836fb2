/**
 * @file application.cpp
 * @brief Application lifecycle implementation
 */

#include "cursers/application.hpp"

#include <string>
#include <utility>

#include "cursers/errors.hpp"
#include "cursers/log.hpp"

namespace cursers {

namespace {
constexpr const char *kComponent = "Application";

// Clears the in-flight flag when a tick ends, however it ends
struct TickGuard {
    std::atomic<bool> &ticking;
    ~TickGuard() {
        ticking.store(false);
    }
};
} // namespace

const char *to_string(AppState state) {
    switch (state) {
    case AppState::Created:
        return "created";
    case AppState::Entered:
        return "entered";
    case AppState::Running:
        return "running";
    case AppState::Exited:
        return "exited";
    }
    return "unknown";
}

Application::Application(Terminal &terminal, Hooks hooks, AppConfig config)
    : config_(config), budget_(config_.frame_budget()), hooks_(std::move(hooks)),
      session_(terminal, ScreenOptions{config_.keypad}) {}

Application::~Application() {
    if (!is_entered()) {
        return;
    }
    try {
        exit();
    } catch (const std::exception &e) {
        log(LogLevel::Error, kComponent, std::string("exit failed during destruction: ") + e.what());
    }
}

void Application::enter() {
    if (state_.load() != AppState::Created) {
        throw InvalidState(std::string("enter() called on an application that is ") +
                           to_string(state_.load()));
    }

    // Acquisition failures propagate before any hook runs
    session_.enter();
    state_.store(AppState::Entered);

    if (hooks_.on_enter) {
        try {
            hooks_.on_enter(*this);
        } catch (...) {
            state_.store(AppState::Exited);
            session_.exit();
            throw;
        }
    }
}

bool Application::update() {
    if (!is_entered() || exiting_) {
        throw InvalidState(std::string("update() called on an application that is ") +
                           (exiting_ ? "exiting" : to_string(state_.load())));
    }
    std::thread::id bound = update_thread_.load();
    if (bound != std::thread::id() && bound != std::this_thread::get_id()) {
        throw InvalidState("update() called from a thread other than the update loop");
    }
    if (ticking_.exchange(true)) {
        throw InvalidState("update() called while another tick is in flight");
    }
    TickGuard guard{ticking_};

    if (exit_signal_.is_requested()) {
        return false;
    }

    state_.store(AppState::Running);
    std::optional<KeyCode> key = session_.read_key();
    if (hooks_.on_update) {
        hooks_.on_update(*this, key);
    }
    session_.refresh();
    return true;
}

void Application::exit() {
    AppState current = state_.load();
    if (current == AppState::Exited || exiting_) {
        return;
    }
    if (current == AppState::Created) {
        throw InvalidState("exit() called before enter()");
    }
    if (ticking_.load()) {
        throw InvalidState("exit() called while a tick is in flight; use request_exit()");
    }

    exiting_ = true;
    exit_signal_.request_exit();

    try {
        if (hooks_.on_exit) {
            hooks_.on_exit(*this);
        }
    } catch (...) {
        state_.store(AppState::Exited);
        session_.exit();
        throw;
    }

    state_.store(AppState::Exited);
    session_.exit();
}

void Application::run(const std::function<void(Application &)> &body) {
    enter();
    try {
        body(*this);
    } catch (...) {
        try {
            exit();
        } catch (const std::exception &e) {
            log(LogLevel::Error, kComponent,
                std::string("on_exit failed while unwinding an earlier error: ") + e.what());
        }
        throw;
    }
    exit();
}

LoopStats Application::run_paced() {
    LoopStats stats;
    run([&](Application &app) {
        PacedLoop loop(budget_, exit_signal_);
        stats = loop.run([&app] { app.update(); });
    });
    return stats;
}

ScreenSession &Application::screen() {
    if (!is_entered()) {
        throw InvalidState(std::string("screen() called on an application that is ") +
                           to_string(state_.load()));
    }
    return session_;
}

bool Application::is_entered() const {
    AppState current = state_.load();
    return current == AppState::Entered || current == AppState::Running;
}

} // namespace cursers
