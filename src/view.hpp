#pragma once
/*
 * View
 *
 * Purpose: draw the session: tab bar, page text with search highlights,
 *          status/command line, help screen.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; reads a Session snapshot, never mutates it.
 */
#include <string>
#include <string_view>
#include "iterminal.hpp"
#include "session.hpp"

struct ViewOptions {
  bool tab_bar = true;
};

// Rows left for page text once the tab bar and status line are taken.
int content_height(int rows, bool tab_bar);

// Screen cells of UTF-8 text, one per code point.
int display_width(std::string_view s);
std::string clip_columns(std::string_view s, int cols);

class View {
public:
  void render(ITerminal& term, const Session& session, const ViewOptions& opts);
private:
  void draw_tab_bar(ITerminal& term, const Session& session, int cols);
  void draw_page(ITerminal& term, const ManPage& page, int top, int height, int cols);
  void draw_line(ITerminal& term, int row, const std::string& line, const ManPage& page, int line_idx, int cols);
  void draw_help(ITerminal& term, int top, int height, int cols);
  void draw_empty(ITerminal& term, int top, int height, int cols);
  void draw_status(ITerminal& term, const Session& session, int row, int cols);
};
