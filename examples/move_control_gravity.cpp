/**
 * @file move_control_gravity.cpp
 * @brief Move a point with W/A/S/D while gravity pulls it down
 *
 * The update loop runs on the worker thread. The main thread applies
 * gravity once per second; the position is shared under a mutex.
 */

#include <chrono>
#include <cstdio>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>

#include "cursers/cursers.hpp"

namespace {

struct World {
    std::mutex mutex;
    int x = 0;
    int y = 0;
};

std::string format_coordinate(int value) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%12d", value);
    return buf;
}

} // namespace

int main(int argc, char **argv) {
    cursers::ParsedArgs args;
    try {
        args = cursers::parse_args(argc, argv);
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

    World world;
    cursers::Hooks hooks;
    hooks.on_enter = [](cursers::Application &app) {
        auto &screen = app.screen();
        screen.draw_text(0, 1, "Movement Control with Gravity", {.bold = true, .underline = true});
        screen.draw_text(3, 2, "X coordinate: ");
        screen.draw_text(4, 2, "Y coordinate: ");

        screen.draw_text(7, 2, "Keyboard Controls:", {.bold = true});
        screen.draw_text(8, 4, "W/S - Move up/down");
        screen.draw_text(9, 4, "A/D - Move left/right");
        screen.draw_text(10, 4, "ESC - Exit app", {.bold = true});
    };
    hooks.on_update = [&world](cursers::Application &app, std::optional<cursers::KeyCode> key) {
        std::lock_guard<std::mutex> lock(world.mutex);
        if (key) {
            switch (*key) {
            case cursers::keys::ESCAPE:
                app.request_exit();
                return;
            case 'w':
            case 'W':
                --world.y;
                break;
            case 's':
            case 'S':
                ++world.y;
                break;
            case 'a':
            case 'A':
                --world.x;
                break;
            case 'd':
            case 'D':
                ++world.x;
                break;
            default:
                break;
            }
        }
        app.screen().draw_text(3, 16, format_coordinate(world.x));
        app.screen().draw_text(4, 16, format_coordinate(world.y));
    };

    try {
        cursers::NcursesTerminal terminal;
        cursers::ThreadedApplication app(terminal, std::move(hooks), args.config);
        app.run([&world](cursers::ThreadedApplication &running) {
            while (!running.wait_for(std::chrono::seconds(1))) {
                std::lock_guard<std::mutex> lock(world.mutex);
                ++world.y;
            }
        });
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
