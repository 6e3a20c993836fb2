/**
 * @file config.cpp
 * @brief Frame budget derivation and argument parsing
 */

#include "cursers/config.hpp"

#include <cmath>
#include <sstream>
#include <string_view>

#include "cursers/errors.hpp"

namespace cursers {

FrameBudget FrameBudget::from_fps(double fps) {
    if (!std::isfinite(fps) || fps <= 0.0) {
        std::ostringstream msg;
        msg << "fps must be a positive number, got " << fps;
        throw ConfigError(msg.str());
    }
    return FrameBudget(fps, Duration(1.0 / fps));
}

void AppConfig::validate() const {
    (void)FrameBudget::from_fps(fps);
}

namespace {

double parse_fps(std::string_view text) {
    std::string value(text);
    std::size_t consumed = 0;
    double fps = 0.0;
    try {
        fps = std::stod(value, &consumed);
    } catch (const std::exception &) {
        throw ConfigError("invalid value for --fps: '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ConfigError("invalid value for --fps: '" + value + "'");
    }
    FrameBudget::from_fps(fps);
    return fps;
}

} // namespace

ParsedArgs parse_args(int argc, const char *const *argv, const AppConfig &defaults) {
    ParsedArgs parsed;
    parsed.config = defaults;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};

        // Options taking a value accept both "--opt value" and "--opt=value"
        auto take_value = [&](std::string_view name) -> std::string_view {
            if (arg.size() > name.size() && arg[name.size()] == '=') {
                return arg.substr(name.size() + 1);
            }
            if (i + 1 >= argc) {
                throw ConfigError("missing value for " + std::string(name));
            }
            return std::string_view{argv[++i]};
        };

        if (arg == "-h" || arg == "--help") {
            parsed.show_help = true;
        } else if (arg == "--keypad") {
            parsed.config.keypad = true;
        } else if (arg == "--fps" || arg.starts_with("--fps=")) {
            parsed.config.fps = parse_fps(take_value("--fps"));
        } else if (arg == "--log-level" || arg.starts_with("--log-level=")) {
            std::string_view name = take_value("--log-level");
            auto level = parse_log_level(name);
            if (!level) {
                throw ConfigError("unknown log level: '" + std::string(name) + "'");
            }
            parsed.log_level = *level;
        } else {
            throw ConfigError("unknown option: '" + std::string(arg) + "'");
        }
    }

    return parsed;
}

std::string usage(const std::string &program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "\n"
        << "Options:\n"
        << "  --fps N              Target update rate (default 30)\n"
        << "  --keypad             Decode arrow and function keys\n"
        << "  --log-level LEVEL    debug, info, warning, error or off (default warning)\n"
        << "  -h, --help           Show this help message\n";
    return out.str();
}

} // namespace cursers
