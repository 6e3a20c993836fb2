/**
 * @file ncurses_terminal.hpp
 * @brief Terminal implementation backed by ncurses
 */

#pragma once

#include <cstdio>

#include "cursers/terminal.hpp"

// ncurses' SCREEN type, kept out of this header
struct screen;

namespace cursers {

/**
 * @brief ncurses-backed terminal
 *
 * acquire() opens a curses screen on stdout/stdin with newterm(), then
 * switches to cbreak, no-echo, non-blocking input and a hidden cursor.
 * release() undoes each of those and ends curses mode. Non-copyable.
 */
class NcursesTerminal : public Terminal {
  public:
    NcursesTerminal();

    /**
     * @brief Construct on explicit streams
     * @param out Output stream for the screen
     * @param in Input stream for keys
     */
    NcursesTerminal(FILE *out, FILE *in);

    ~NcursesTerminal() override;

    NcursesTerminal(const NcursesTerminal &) = delete;
    NcursesTerminal &operator=(const NcursesTerminal &) = delete;

    void acquire(const ScreenOptions &options) override;
    void release() override;
    std::optional<KeyCode> read_key() override;
    void draw_text(int row, int col, const std::string &text, TextStyle style) override;
    void refresh() override;
    void clear() override;
    TerminalSize size() const override;
    TerminalModes modes() const override;

  private:
    FILE *out_;
    FILE *in_;
    struct screen *screen_{nullptr}; ///< Active curses screen, null when released
    int saved_cursor_{1};            ///< Cursor visibility before acquire()
    TerminalModes modes_;
};

} // namespace cursers
