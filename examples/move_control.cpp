/**
 * @file move_control.cpp
 * @brief Move a point with W/A/S/D; ESC quits
 *
 * Plain Application driven by its own paced loop on the main thread.
 */

#include <cstdio>
#include <iostream>
#include <string>
#include <utility>

#include "cursers/cursers.hpp"

namespace {

struct Position {
    int x = 0;
    int y = 0;
};

std::string format_coordinate(int value) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%12d", value);
    return buf;
}

void draw_position(cursers::ScreenSession &screen, const Position &pos) {
    screen.draw_text(3, 16, format_coordinate(pos.x));
    screen.draw_text(4, 16, format_coordinate(pos.y));
}

} // namespace

int main(int argc, char **argv) {
    cursers::AppConfig defaults;
    defaults.keypad = true;

    cursers::ParsedArgs args;
    try {
        args = cursers::parse_args(argc, argv, defaults);
    } catch (const cursers::ConfigError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << cursers::usage(argv[0]);
        return 2;
    }
    if (args.show_help) {
        std::cout << cursers::usage(argv[0]);
        return 0;
    }
    cursers::set_log_level(args.log_level);

    Position pos;
    cursers::Hooks hooks;
    hooks.on_enter = [&pos](cursers::Application &app) {
        auto &screen = app.screen();
        screen.draw_text(0, 7, "Movement Control", {.bold = true, .underline = true});
        screen.draw_text(3, 2, "X coordinate: ");
        screen.draw_text(4, 2, "Y coordinate: ");
        draw_position(screen, pos);

        screen.draw_text(7, 2, "Keyboard Controls:", {.bold = true});
        screen.draw_text(8, 4, "W/S - Move up/down");
        screen.draw_text(9, 4, "A/D - Move left/right");
        screen.draw_text(10, 4, "ESC - Exit app", {.bold = true});
    };
    hooks.on_update = [&pos](cursers::Application &app, std::optional<cursers::KeyCode> key) {
        if (!key) {
            return;
        }
        switch (*key) {
        case cursers::keys::ESCAPE:
            app.request_exit();
            return;
        case 'w':
        case 'W':
            --pos.y;
            break;
        case 's':
        case 'S':
            ++pos.y;
            break;
        case 'a':
        case 'A':
            --pos.x;
            break;
        case 'd':
        case 'D':
            ++pos.x;
            break;
        default:
            return;
        }
        draw_position(app.screen(), pos);
    };

    try {
        cursers::NcursesTerminal terminal;
        cursers::Application app(terminal, std::move(hooks), args.config);
        app.run_paced();
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
