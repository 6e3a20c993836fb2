#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>
#include <vector>

#include "cursers/application.hpp"
#include "cursers/config.hpp"
#include "cursers/errors.hpp"
#include "cursers/log.hpp"
#include "../support/fake_terminal.hpp"

using namespace cursers;

namespace {

template <typename Fn> bool throws_config_error(Fn &&fn) {
    try {
        fn();
    } catch (const ConfigError &) {
        return true;
    }
    return false;
}

ParsedArgs parse(std::vector<const char *> args) {
    args.insert(args.begin(), "prog");
    return parse_args(static_cast<int>(args.size()), args.data());
}

} // namespace

void test_frame_duration_is_inverse_of_fps() {
    for (double fps : {1.0, 10.0, 30.0, 60.0, 144.0, 0.5}) {
        FrameBudget budget = FrameBudget::from_fps(fps);
        assert(budget.fps() == fps);
        assert(budget.frame_duration().count() == 1.0 / fps);
    }

    AppConfig config;
    assert(config.fps == 30.0);
    assert(config.keypad == false);
    assert(config.stop_on_error == true);
    assert(config.frame_budget().frame_duration().count() == 1.0 / 30.0);

    std::cout << "✓ test_frame_duration_is_inverse_of_fps passed" << std::endl;
}

void test_non_positive_fps_rejected() {
    assert(throws_config_error([] { FrameBudget::from_fps(0.0); }));
    assert(throws_config_error([] { FrameBudget::from_fps(-30.0); }));
    assert(throws_config_error([] { FrameBudget::from_fps(std::numeric_limits<double>::quiet_NaN()); }));
    assert(throws_config_error([] { FrameBudget::from_fps(std::numeric_limits<double>::infinity()); }));

    AppConfig config;
    config.fps = 0.0;
    assert(throws_config_error([&] { config.validate(); }));

    std::cout << "✓ test_non_positive_fps_rejected passed" << std::endl;
}

void test_application_rejects_bad_fps_at_construction() {
    testing::FakeTerminal terminal;
    AppConfig config;
    config.fps = -1.0;

    assert(throws_config_error([&] { Application app(terminal, Hooks{}, config); }));
    assert(terminal.acquire_calls() == 0);

    std::cout << "✓ test_application_rejects_bad_fps_at_construction passed" << std::endl;
}

void test_parse_args() {
    ParsedArgs defaults = parse({});
    assert(defaults.config.fps == 30.0);
    assert(!defaults.config.keypad);
    assert(defaults.log_level == LogLevel::Warning);
    assert(!defaults.show_help);

    ParsedArgs full = parse({"--fps", "60", "--keypad", "--log-level", "debug"});
    assert(full.config.fps == 60.0);
    assert(full.config.keypad);
    assert(full.log_level == LogLevel::Debug);

    ParsedArgs inline_values = parse({"--fps=12.5", "--log-level=OFF"});
    assert(inline_values.config.fps == 12.5);
    assert(inline_values.log_level == LogLevel::Off);

    assert(parse({"-h"}).show_help);
    assert(parse({"--help"}).show_help);

    assert(throws_config_error([] { parse({"--fps"}); }));
    assert(throws_config_error([] { parse({"--fps", "fast"}); }));
    assert(throws_config_error([] { parse({"--fps", "10x"}); }));
    assert(throws_config_error([] { parse({"--fps", "0"}); }));
    assert(throws_config_error([] { parse({"--log-level", "loud"}); }));
    assert(throws_config_error([] { parse({"--frobnicate"}); }));

    assert(usage("prog").find("--fps") != std::string::npos);

    std::cout << "✓ test_parse_args passed" << std::endl;
}

void test_log_filtering_and_format() {
    std::ostringstream out;
    set_log_stream(&out);
    set_log_level(LogLevel::Warning);

    log(LogLevel::Debug, "Test", "hidden");
    log(LogLevel::Warning, "Test", "shown");
    assert(out.str() == "[Test] warning: shown\n");

    set_log_level(LogLevel::Off);
    log(LogLevel::Error, "Test", "silenced");
    assert(out.str() == "[Test] warning: shown\n");

    assert(parse_log_level("Info") == LogLevel::Info);
    assert(!parse_log_level("verbose").has_value());

    set_log_level(LogLevel::Warning);
    set_log_stream(nullptr);

    std::cout << "✓ test_log_filtering_and_format passed" << std::endl;
}

int main() {
    std::cout << "Running config tests..." << std::endl;

    try {
        test_frame_duration_is_inverse_of_fps();
        test_non_positive_fps_rejected();
        test_application_rejects_bad_fps_at_construction();
        test_parse_args();
        test_log_filtering_and_format();
    } catch (const std::exception &e) {
        std::cerr << "✗ Test failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "All config tests passed!" << std::endl;
    return 0;
}
