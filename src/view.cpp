#include "view.hpp"
#include <algorithm>
#include <sstream>
#include <vector>

static const char* const kHelpLines[] = {
  "manifold - tabbed manual page viewer",
  "",
  "  j / Down / Enter     scroll down (count prefix: 5j)",
  "  k / Up               scroll up",
  "  Space / PageDown     page down",
  "  b / PageUp           page up",
  "  Ctrl-D / Ctrl-U      half page down / up",
  "  g / Home, G / End    top / bottom",
  "  h / Left, l / Right  previous / next tab",
  "  /                    search (incremental)",
  "  n / N                next / previous match",
  "  Ctrl-L               clear search",
  "  :                    command line",
  "  ?                    toggle this help",
  "  q / Esc              quit",
  "",
  "commands:",
  "  :man [SECTION] NAME...   open pages in new tabs",
  "  :wipe, :w               close the current tab",
  "  :help, :h               show this help",
  "  :quit, :q               quit",
};

int content_height(int rows, bool tab_bar) {
  return std::max(0, rows - 1 - (tab_bar ? 1 : 0));
}

static bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

int display_width(std::string_view s) {
  int w = 0;
  for (unsigned char c : s) if (!is_continuation(c)) w++;
  return w;
}

std::string clip_columns(std::string_view s, int cols) {
  if (cols <= 0) return std::string();
  int w = 0;
  size_t i = 0;
  for (; i < s.size(); ++i) {
    if (!is_continuation(static_cast<unsigned char>(s[i]))) {
      if (w == cols) break;
      w++;
    }
  }
  return std::string(s.substr(0, i));
}

void View::render(ITerminal& term, const Session& session, const ViewOptions& opts) {
  TermSize sz = term.getSize();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  if (rows <= 0 || cols <= 0) { term.refresh(); return; }
  int top = 0;
  if (opts.tab_bar && rows > 1) {
    draw_tab_bar(term, session, cols);
    top = 1;
  }
  int height = content_height(rows, opts.tab_bar && rows > 1);
  if (std::holds_alternative<HelpMode>(session.mode())) draw_help(term, top, height, cols);
  else if (const ManPage* page = session.active_page()) draw_page(term, *page, top, height, cols);
  else draw_empty(term, top, height, cols);
  draw_status(term, session, rows - 1, cols);
  term.refresh();
}

void View::draw_tab_bar(ITerminal& term, const Session& session, int cols) {
  const auto& tabs = session.tabs().tabs();
  int col = 0;
  if (tabs.empty()) {
    term.draw_text(0, 0, clip_columns(" manifold ", cols));
    term.clear_to_eol(0, std::min(cols, 10));
    return;
  }
  for (int i = 0; i < (int)tabs.size() && col < cols; ++i) {
    std::string label = clip_columns(" " + tabs[i].title() + " ", cols - col);
    int w = display_width(label);
    if (i == session.active_index()) term.draw_highlighted(0, col, label, 0, (int)label.size());
    else term.draw_text(0, col, label);
    col += w;
  }
  if (col < cols) term.clear_to_eol(0, col);
}

void View::draw_page(ITerminal& term, const ManPage& page, int top, int height, int cols) {
  const auto& lines = page.lines();
  for (int i = 0; i < height; ++i) {
    int line_idx = page.scroll + i;
    if (line_idx >= (int)lines.size()) break;
    draw_line(term, top + i, lines[line_idx], page, line_idx, cols);
  }
}

void View::draw_line(ITerminal& term, int row, const std::string& line, const ManPage& page, int line_idx, int cols) {
  const auto& matches = page.search_matches();
  auto first = std::lower_bound(matches.begin(), matches.end(), line_idx,
                                [](const SearchMatch& m, int l){ return m.line < l; });
  std::optional<int> current = page.search_index();
  int col = 0;
  int pos = 0;
  auto emit = [&](int from, int to, int pair) {
    if (to <= from || col >= cols) return;
    std::string seg = clip_columns(std::string_view(line).substr(from, to - from), cols - col);
    if (pair == 0) term.draw_text(row, col, seg);
    else term.draw_colored(row, col, seg, pair);
    col += display_width(seg);
  };
  for (auto it = first; it != matches.end() && it->line == line_idx; ++it) {
    int k = (int)(it - matches.begin());
    emit(pos, it->start, 0);
    emit(it->start, it->end, (current && *current == k) ? kCurrentMatchPair : kMatchPair);
    pos = it->end;
  }
  emit(pos, (int)line.size(), 0);
  if (col < cols) term.clear_to_eol(row, col);
}

void View::draw_help(ITerminal& term, int top, int height, int cols) {
  int n = (int)(sizeof(kHelpLines) / sizeof(kHelpLines[0]));
  for (int i = 0; i < n && i < height; ++i) {
    std::string s = clip_columns(kHelpLines[i], cols);
    term.draw_text(top + i, 0, s);
    term.clear_to_eol(top + i, display_width(s));
  }
}

void View::draw_empty(ITerminal& term, int top, int height, int cols) {
  if (height <= 0) return;
  std::string hint = clip_columns("Type :man NAME to open a manual page, ? for help, q to quit", cols);
  int row = top + (height - 1) / 2;
  int col = std::max(0, (cols - display_width(hint)) / 2);
  term.draw_text(row, col, hint);
}

void View::draw_status(ITerminal& term, const Session& session, int row, int cols) {
  const Mode& mode = session.mode();
  if (auto* cm = std::get_if<CommandMode>(&mode)) {
    std::string s = clip_columns(":" + cm->line, cols);
    term.draw_text(row, 0, s);
    term.clear_to_eol(row, display_width(s));
    term.move_cursor(row, std::min(cols - 1, display_width(s)));
    term.show_cursor(true);
    return;
  }
  if (auto* sm = std::get_if<SearchMode>(&mode)) {
    std::string s = clip_columns("/" + sm->line, cols);
    term.draw_text(row, 0, s);
    term.clear_to_eol(row, display_width(s));
    term.move_cursor(row, std::min(cols - 1, display_width(s)));
    term.show_cursor(true);
    return;
  }
  std::ostringstream oss;
  if (std::holds_alternative<HelpMode>(mode)) {
    oss << "HELP  press ? or q to return";
  } else {
    oss << session.title();
    if (const ManPage* page = session.active_page()) {
      int total = page->line_count();
      oss << "  line " << (total == 0 ? 0 : page->scroll + 1) << "/" << total;
      if (page->search_query()) {
        int n = (int)page->search_matches().size();
        if (n == 0) oss << "  /" << *page->search_query() << " (no matches)";
        else oss << "  [" << (page->search_index().value_or(0) + 1) << "/" << n << "] /" << *page->search_query();
      }
    }
  }
  if (session.status_message()) oss << "  | " << *session.status_message();
  std::string s = clip_columns(oss.str(), cols);
  term.draw_text(row, 0, s);
  term.clear_to_eol(row, display_width(s));
  term.show_cursor(false);
}
