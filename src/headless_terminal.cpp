#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols) {
  resize(rows, cols);
}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = std::max(0, rows);
  cols_ = std::max(0, cols);
  cells_.assign(rows_, std::string(cols_, ' '));
  attrs_.assign(rows_, std::string(cols_, ' '));
}

void HeadlessTerminal::push_keys(const std::string& keys) {
  for (unsigned char c : keys) keys_.push_back(c);
}

void HeadlessTerminal::push_key(int key) { keys_.push_back(key); }

int HeadlessTerminal::read_key() {
  if (keys_.empty()) return 27;
  int k = keys_.front();
  keys_.pop_front();
  return k;
}

void HeadlessTerminal::clear() {
  for (auto& r : cells_) std::fill(r.begin(), r.end(), ' ');
  for (auto& r : attrs_) std::fill(r.begin(), r.end(), ' ');
}

void HeadlessTerminal::put(int row, int col, const std::string& text, char attr) {
  if (row < 0 || row >= rows_) return;
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + (int)i;
    if (c < 0) continue;
    if (c >= cols_) break;
    cells_[row][c] = text[i];
    attrs_[row][c] = attr;
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  put(row, col, text, ' ');
}

void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = (int)text.size();
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(0, hl_len), hl_start, len);
  put(row, col, text.substr(0, hl_start), ' ');
  put(row, col + hl_start, text.substr(hl_start, hl_end - hl_start), 'r');
  put(row, col + hl_end, text.substr(hl_end), ' ');
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  put(row, col, text, static_cast<char>('0' + color_pair_id));
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_) return;
  for (int c = std::max(0, col); c < cols_; ++c) { cells_[row][c] = ' '; attrs_[row][c] = ' '; }
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  std::string s = cells_[row];
  while (!s.empty() && s.back() == ' ') s.pop_back();
  return s;
}

char HeadlessTerminal::attr_at(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return ' ';
  return attrs_[row][col];
}
