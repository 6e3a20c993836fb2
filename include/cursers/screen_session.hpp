/**
 * @file screen_session.hpp
 * @brief Scoped ownership of the process-wide screen
 *
 * A ScreenSession holds the terminal between enter() and exit(). Only one
 * session may be active in the process at a time; the destructor releases
 * a session that was never exited.
 */

#pragma once

#include <optional>
#include <string>

#include "cursers/terminal.hpp"

namespace cursers {

/**
 * @brief Exclusive, scoped handle on the terminal screen
 *
 * Hooks receive the session to draw and read keys. Non-copyable.
 */
class ScreenSession {
  public:
    /**
     * @brief Construct an inactive session
     * @param terminal Collaborator to drive; must outlive the session
     * @param options Modes applied on enter()
     */
    explicit ScreenSession(Terminal &terminal, ScreenOptions options = {});

    /**
     * @brief Release the screen if still held
     */
    ~ScreenSession();

    ScreenSession(const ScreenSession &) = delete;
    ScreenSession &operator=(const ScreenSession &) = delete;

    /**
     * @brief Acquire the screen
     * @throws ResourceUnavailable if another session holds the screen or the
     *         terminal cannot be configured
     * @throws InvalidState if this session is already active
     */
    void enter();

    /**
     * @brief Restore the terminal and release the screen
     *
     * No-op when the session is not active.
     */
    void exit();

    bool is_active() const {
        return active_;
    }

    /**
     * @brief Read one key without blocking
     * @return std::optional<KeyCode> Key code, or nullopt when no input is pending
     */
    std::optional<KeyCode> read_key();

    /**
     * @brief Draw text at a screen position
     * @param row Row (0-based)
     * @param col Column (0-based)
     * @param text Text to draw
     * @param style Bold/underline attributes
     * @throws std::out_of_range for a negative row or column
     */
    void draw_text(int row, int col, const std::string &text, TextStyle style = {});

    void refresh();
    void clear();

    int rows() const;
    int cols() const;

    const ScreenOptions &options() const {
        return options_;
    }

  private:
    void require_active(const char *operation) const;

    Terminal &terminal_;
    ScreenOptions options_;
    bool active_{false};
};

/**
 * @brief Whether any ScreenSession in the process currently holds the screen
 */
bool screen_held();

} // namespace cursers
