#include "ncurses_terminal.hpp"
#include <algorithm>

static short color_from_name(const std::string& v) {
  if (v == "black") return COLOR_BLACK;
  if (v == "white") return COLOR_WHITE;
  if (v == "red") return COLOR_RED;
  if (v == "green") return COLOR_GREEN;
  if (v == "blue") return COLOR_BLUE;
  if (v == "yellow") return COLOR_YELLOW;
  if (v == "magenta") return COLOR_MAGENTA;
  if (v == "cyan") return COLOR_CYAN;
  return -1; // default
}

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    colors_ = true;
    default_colors_ = use_default_colors() == OK;
    init_pair(kMatchPair, COLOR_BLACK, searchhl_color_);
    init_pair(kCurrentMatchPair, COLOR_BLACK, currenthl_color_);
  }
}

short NcursesTerminal::background(const std::string& color, short fallback) const {
  short c = color_from_name(color);
  if (c < 0 && !default_colors_) return fallback;
  return c;
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

int NcursesTerminal::read_key() { return getch(); }

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = (int)text.size();
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(0, hl_len), hl_start, len);
  move(row, col);
  if (hl_start > 0) addnstr(text.c_str(), hl_start);
  if (hl_end > hl_start) {
    attron(A_REVERSE);
    addnstr(text.c_str() + hl_start, hl_end - hl_start);
    attroff(A_REVERSE);
  }
  if (hl_end < len) addnstr(text.c_str() + hl_end, len - hl_end);
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  // Without colors both kinds of match fall back to reverse video.
  attr_t attr = colors_ ? COLOR_PAIR(color_pair_id) : A_REVERSE;
  if (color_pair_id == kCurrentMatchPair) attr |= A_BOLD;
  attron(attr);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(attr);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::show_cursor(bool visible) { curs_set(visible ? 1 : 0); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

void NcursesTerminal::setSearchHighlight(const std::string& color) {
  if (!colors_) return;
  searchhl_color_ = background(color, COLOR_CYAN);
  init_pair(kMatchPair, COLOR_BLACK, searchhl_color_);
}

void NcursesTerminal::setCurrentHighlight(const std::string& color) {
  if (!colors_) return;
  currenthl_color_ = background(color, COLOR_YELLOW);
  init_pair(kCurrentMatchPair, COLOR_BLACK, currenthl_color_);
}
