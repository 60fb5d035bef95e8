#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main before any drawing; the destructor restores the
 *        terminal on every exit path, including a propagating RenderFault.
 * Note: manages terminal modes (raw/noecho/keypad), not rendering.
 */
#include <ncurses.h>

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
};
