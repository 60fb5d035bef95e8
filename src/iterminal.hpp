#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, keys, clear, draw, cursor, refresh).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 * Note: columns are screen cells; callers pass text already clipped to the width.
 */
#include <string>

struct TermSize { int rows; int cols; };

// Color pairs understood by draw_colored.
constexpr int kMatchPair = 1;
constexpr int kCurrentMatchPair = 2;

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual int read_key() = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void show_cursor(bool visible) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
};
