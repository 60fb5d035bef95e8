#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and key input.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 */
#include "iterminal.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  TermSize getSize() const override;
  int read_key() override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override;
  void show_cursor(bool visible) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
  // Color names as accepted by the rc file (see is_color_name).
  void setSearchHighlight(const std::string& color);
  void setCurrentHighlight(const std::string& color);
private:
  // -1 (terminal default) needs use_default_colors; otherwise `fallback`.
  short background(const std::string& color, short fallback) const;

  short searchhl_color_ = COLOR_CYAN;
  short currenthl_color_ = COLOR_YELLOW;
  bool colors_ = false;
  bool default_colors_ = false;
};
