/**
 * @file cursers.hpp
 * @brief Convenience header for the whole public API
 */

#pragma once

#include "cursers/application.hpp"
#include "cursers/config.hpp"
#include "cursers/errors.hpp"
#include "cursers/exit_signal.hpp"
#include "cursers/log.hpp"
#include "cursers/ncurses_terminal.hpp"
#include "cursers/paced_loop.hpp"
#include "cursers/screen_session.hpp"
#include "cursers/terminal.hpp"
#include "cursers/threaded_application.hpp"
#include "cursers/worker.hpp"
