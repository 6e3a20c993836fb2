/**
 * @file screen_session.cpp
 * @brief ScreenSession implementation
 */

#include "cursers/screen_session.hpp"

#include <atomic>
#include <stdexcept>

#include "cursers/errors.hpp"
#include "cursers/log.hpp"

namespace cursers {

namespace {

constexpr const char *kComponent = "ScreenSession";

// Set while some session owns the terminal
std::atomic<bool> g_screen_claimed{false};

// Drops the process-wide claim when teardown leaves scope, even if the
// collaborator throws from release()
struct ClaimGuard {
    ~ClaimGuard() {
        g_screen_claimed.store(false);
    }
};

} // namespace

bool screen_held() {
    return g_screen_claimed.load();
}

ScreenSession::ScreenSession(Terminal &terminal, ScreenOptions options)
    : terminal_(terminal), options_(options) {}

ScreenSession::~ScreenSession() {
    try {
        exit();
    } catch (const std::exception &e) {
        log(LogLevel::Error, kComponent, std::string("release failed during destruction: ") + e.what());
    }
}

void ScreenSession::enter() {
    if (active_) {
        throw InvalidState("screen session entered twice");
    }

    bool expected = false;
    if (!g_screen_claimed.compare_exchange_strong(expected, true)) {
        throw ResourceUnavailable("screen is already held by another session");
    }

    try {
        terminal_.acquire(options_);
    } catch (...) {
        g_screen_claimed.store(false);
        throw;
    }

    active_ = true;
    log(LogLevel::Debug, kComponent, options_.keypad ? "screen acquired (keypad on)" : "screen acquired");
}

void ScreenSession::exit() {
    if (!active_) {
        return;
    }
    active_ = false;

    ClaimGuard guard;
    terminal_.release();
    log(LogLevel::Debug, kComponent, "screen released");
}

std::optional<KeyCode> ScreenSession::read_key() {
    require_active("read_key");
    return terminal_.read_key();
}

void ScreenSession::draw_text(int row, int col, const std::string &text, TextStyle style) {
    require_active("draw_text");
    if (row < 0 || col < 0) {
        throw std::out_of_range("draw_text position must not be negative");
    }
    terminal_.draw_text(row, col, text, style);
}

void ScreenSession::refresh() {
    require_active("refresh");
    terminal_.refresh();
}

void ScreenSession::clear() {
    require_active("clear");
    terminal_.clear();
}

int ScreenSession::rows() const {
    return active_ ? terminal_.size().rows : 0;
}

int ScreenSession::cols() const {
    return active_ ? terminal_.size().cols : 0;
}

void ScreenSession::require_active(const char *operation) const {
    if (!active_) {
        throw InvalidState(std::string(operation) + " called on an inactive screen session");
    }
}

} // namespace cursers
