/**
 * @file config.hpp
 * @brief Construction-time configuration for applications
 *
 * Configuration is immutable once an Application is built. The frame
 * budget is derived from the target rate and validated up front so that a
 * bad rate fails before any terminal state is touched.
 */

#pragma once

#include <chrono>
#include <string>

#include "cursers/log.hpp"

namespace cursers {

/**
 * @brief Target wall-clock duration of one tick
 */
class FrameBudget {
  public:
    using Duration = std::chrono::duration<double>;

    /**
     * @brief Derive the budget from a frame rate
     * @param fps Frames per second, must be positive and finite
     * @return FrameBudget with frame_duration() == 1 / fps seconds
     * @throws ConfigError if fps is not a positive finite number
     */
    static FrameBudget from_fps(double fps);

    double fps() const {
        return fps_;
    }

    Duration frame_duration() const {
        return frame_duration_;
    }

  private:
    FrameBudget(double fps, Duration frame_duration) : fps_(fps), frame_duration_(frame_duration) {}

    double fps_;
    Duration frame_duration_;
};

/**
 * @brief Options shared by Application and ThreadedApplication
 */
struct AppConfig {
    double fps = 30.0;          ///< Target update rate
    bool keypad = false;        ///< Decode function/arrow keys into single key codes
    bool stop_on_error = true;  ///< Threaded only: a failing tick also requests exit

    /**
     * @brief Check the configuration
     * @throws ConfigError if fps is invalid
     */
    void validate() const;

    FrameBudget frame_budget() const {
        return FrameBudget::from_fps(fps);
    }
};

/**
 * @brief Result of parsing example-program arguments
 */
struct ParsedArgs {
    AppConfig config;
    LogLevel log_level = LogLevel::Warning;
    bool show_help = false;
};

/**
 * @brief Parse "--fps N", "--keypad", "--log-level LEVEL" and "-h/--help"
 * @param argc Argument count
 * @param argv Argument values (argv[0] is skipped)
 * @param defaults Starting configuration that options override
 * @return ParsedArgs Parsed options
 * @throws ConfigError on an unknown option, a missing value or a bad value
 */
ParsedArgs parse_args(int argc, const char *const *argv, const AppConfig &defaults = {});

// Usage text for the options understood by parse_args()
std::string usage(const std::string &program);

} // namespace cursers
