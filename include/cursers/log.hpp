/**
 * @file log.hpp
 * @brief Diagnostic output for the cursers core
 *
 * Lines are written as "[Component] LEVEL: message" to a process-wide
 * stream (std::cerr unless redirected). Safe to call from the worker
 * thread and the controlling thread at the same time.
 */

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace cursers {

enum class LogLevel { Debug, Info, Warning, Error, Off };

/**
 * @brief Set the minimum level that is written (default: Warning)
 */
void set_log_level(LogLevel level);

LogLevel log_level();

/**
 * @brief Redirect diagnostics
 * @param stream Target stream, or nullptr to restore std::cerr
 *
 * The stream must outlive every later call to log().
 */
void set_log_stream(std::ostream *stream);

void log(LogLevel level, std::string_view component, const std::string &message);

// Name used in log lines and on the command line ("debug", "info", ...)
const char *to_string(LogLevel level);

/**
 * @brief Parse a level name, case-insensitive
 * @return std::nullopt for an unknown name
 */
std::optional<LogLevel> parse_log_level(std::string_view name);

} // namespace cursers
