/**
 * @file ncurses_terminal.cpp
 * @brief ncurses implementation of the terminal collaborator
 *
 * Uses newterm() rather than initscr() so that a terminal which cannot be
 * initialized is reported to the caller instead of terminating the process.
 */

#include "cursers/ncurses_terminal.hpp"

#include <algorithm>
#include <stdexcept>

// curses.h defines refresh()/clear() as macros, which would rewrite the
// member functions of the same name
#define NCURSES_NOMACROS
#include <curses.h>

#include "cursers/errors.hpp"
#include "cursers/log.hpp"

namespace cursers {

NcursesTerminal::NcursesTerminal() : NcursesTerminal(stdout, stdin) {}

NcursesTerminal::NcursesTerminal(FILE *out, FILE *in) : out_(out), in_(in) {}

NcursesTerminal::~NcursesTerminal() {
    release();
}

void NcursesTerminal::acquire(const ScreenOptions &options) {
    if (screen_) {
        throw ResourceUnavailable("terminal is already acquired");
    }

    SCREEN *scr = newterm(nullptr, out_, in_);
    if (!scr) {
        throw ResourceUnavailable("cannot initialize terminal (check TERM and that output is a tty)");
    }
    // newterm() makes scr the current screen

    if (cbreak() == ERR || noecho() == ERR || nodelay(stdscr, TRUE) == ERR ||
        keypad(stdscr, options.keypad ? TRUE : FALSE) == ERR) {
        endwin();
        // Deleting the current screen also clears ncurses' current-screen pointer
        delscreen(scr);
        throw ResourceUnavailable("cannot set terminal input mode");
    }

    // Not every terminal can hide the cursor; that is not fatal
    int previous = curs_set(0);
    saved_cursor_ = previous;

    screen_ = scr;
    modes_.echo = false;
    modes_.cbreak = true;
    modes_.cursor_visible = (previous == ERR);
}

void NcursesTerminal::release() {
    if (!screen_) {
        return;
    }
    set_term(screen_);
    if (saved_cursor_ != ERR) {
        curs_set(saved_cursor_);
    }
    // endwin() puts back the tty modes saved by newterm()
    if (endwin() == ERR) {
        log(LogLevel::Warning, "NcursesTerminal", "endwin failed; terminal modes may not be restored");
    }
    delscreen(screen_);
    screen_ = nullptr;
    modes_ = TerminalModes{};
}

std::optional<KeyCode> NcursesTerminal::read_key() {
    if (!screen_) {
        return std::nullopt;
    }
    int ch = wgetch(stdscr);
    if (ch == ERR) {
        return std::nullopt;
    }
    return ch;
}

void NcursesTerminal::draw_text(int row, int col, const std::string &text, TextStyle style) {
    if (!screen_) {
        return;
    }
    if (wmove(stdscr, row, col) == ERR) {
        throw std::out_of_range("draw_text position outside the screen");
    }

    attr_t attr = A_NORMAL;
    if (style.bold) {
        attr |= A_BOLD;
    }
    if (style.underline) {
        attr |= A_UNDERLINE;
    }

    int room = getmaxx(stdscr) - col;
    int len = std::min(static_cast<int>(text.size()), room);
    wattr_on(stdscr, attr, nullptr);
    // ERR here only means the text ended in the bottom-right cell
    (void)waddnstr(stdscr, text.c_str(), len);
    wattr_off(stdscr, attr, nullptr);
}

void NcursesTerminal::refresh() {
    if (!screen_) {
        return;
    }
    if (wrefresh(stdscr) == ERR) {
        throw std::runtime_error("terminal refresh failed");
    }
}

void NcursesTerminal::clear() {
    if (!screen_) {
        return;
    }
    werase(stdscr);
}

TerminalSize NcursesTerminal::size() const {
    if (!screen_) {
        return {};
    }
    return {getmaxy(stdscr), getmaxx(stdscr)};
}

TerminalModes NcursesTerminal::modes() const {
    return modes_;
}

} // namespace cursers
