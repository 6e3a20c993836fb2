/**
 * @file terminal.hpp
 * @brief Abstract terminal-control collaborator
 *
 * The core never calls a terminal library directly; it goes through this
 * interface so the screen lifecycle can be exercised without a real TTY.
 * NcursesTerminal is the production implementation.
 */

#pragma once

#include <optional>
#include <string>

namespace cursers {

using KeyCode = int;

namespace keys {
constexpr KeyCode ESCAPE = 27;
} // namespace keys

/**
 * @brief Text attributes passed through to the terminal library
 */
struct TextStyle {
    bool bold = false;
    bool underline = false;
};

/**
 * @brief Options applied while acquiring the screen
 */
struct ScreenOptions {
    bool keypad = false; ///< Extended key decoding (arrows, function keys)
};

struct TerminalSize {
    int rows = 0;
    int cols = 0;
};

/**
 * @brief Observable terminal mode settings
 *
 * Used to check that a session leaves the terminal as it found it.
 */
struct TerminalModes {
    bool echo = true;
    bool cbreak = false;
    bool cursor_visible = true;

    bool operator==(const TerminalModes &) const = default;
};

/**
 * @brief Terminal-control collaborator
 *
 * acquire()/release() bracket every other call. Implementations are not
 * required to be thread-safe; the lifecycle guarantees that only one thread
 * touches the terminal at a time.
 */
class Terminal {
  public:
    virtual ~Terminal() = default;

    /**
     * @brief Take the screen and configure input/output modes
     * @param options Mode options
     * @throws ResourceUnavailable if the terminal cannot be set up
     *
     * On failure the terminal is left in its prior state.
     */
    virtual void acquire(const ScreenOptions &options) = 0;

    /**
     * @brief Restore prior modes and give the screen back
     */
    virtual void release() = 0;

    /**
     * @brief Read one pending key without blocking
     * @return std::optional<KeyCode> Key code, or nullopt when no input is pending
     */
    virtual std::optional<KeyCode> read_key() = 0;

    virtual void draw_text(int row, int col, const std::string &text, TextStyle style) = 0;
    virtual void refresh() = 0;
    virtual void clear() = 0;
    virtual TerminalSize size() const = 0;
    virtual TerminalModes modes() const = 0;
};

} // namespace cursers
