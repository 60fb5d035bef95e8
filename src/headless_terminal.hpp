#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests: records a character grid
 *          with per-cell attributes and replays a scripted key sequence.
 * Attr codes: ' ' plain, 'r' reverse, '1' match, '2' current match.
 * Note: one byte per cell, so tests should stick to ASCII text.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  // Once the script is exhausted read_key() keeps returning ESC.
  void push_keys(const std::string& keys);
  void push_key(int key);
  void resize(int rows, int cols);

  std::string row_text(int row) const; // trailing blanks trimmed
  char attr_at(int row, int col) const;
  int cursor_row() const { return cur_row_; }
  int cursor_col() const { return cur_col_; }
  bool cursor_visible() const { return cursor_visible_; }
  int refresh_count() const { return refreshes_; }

  TermSize getSize() const override { return {rows_, cols_}; }
  int read_key() override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override { cur_row_ = row; cur_col_ = col; }
  void show_cursor(bool visible) override { cursor_visible_ = visible; }
  void refresh() override { refreshes_++; }
  void clear_to_eol(int row, int col) override;

private:
  void put(int row, int col, const std::string& text, char attr);

  int rows_;
  int cols_;
  std::vector<std::string> cells_;
  std::vector<std::string> attrs_;
  std::deque<int> keys_;
  int cur_row_ = 0;
  int cur_col_ = 0;
  bool cursor_visible_ = true;
  int refreshes_ = 0;
};
