/**
 * @file errors.hpp
 * @brief Exception types raised by the cursers core
 *
 * Hook exceptions are never wrapped; only failures that originate in the
 * core itself use these types.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace cursers {

/**
 * @brief The screen resource could not be acquired
 *
 * Raised when the process already holds the screen, or when the terminal
 * cannot be placed in the required input/output mode. Never retried.
 */
class ResourceUnavailable : public std::runtime_error {
  public:
    explicit ResourceUnavailable(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief An operation was called in a lifecycle state that does not allow it
 *
 * Examples: update() before enter(), entering a Worker twice.
 */
class InvalidState : public std::logic_error {
  public:
    explicit InvalidState(const std::string &what) : std::logic_error(what) {}
};

// Bad construction-time configuration (non-positive fps, unknown option)
class ConfigError : public std::invalid_argument {
  public:
    explicit ConfigError(const std::string &what) : std::invalid_argument(what) {}
};

} // namespace cursers
