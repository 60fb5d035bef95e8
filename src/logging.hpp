#pragma once
/*
 * Logging
 *
 * Purpose: install the process-wide spdlog logger "manifold".
 * Note: curses owns the terminal, so logs go to a file or nowhere.
 */
#include <string>
#include "config.hpp"

// Returns false with msg set when the log file cannot be opened; a null
// logger is installed in that case.
bool init_logging(const Config& cfg, std::string& msg);
