#include "man_page.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include "search.hpp"

ManPage::ManPage(std::string name, std::optional<std::string> section)
  : name_(std::move(name)), section_(std::move(section)) {}

std::string ManPage::title() const {
  if (section_) return name_ + "(" + *section_ + ")";
  return name_;
}

std::optional<RenderError> ManPage::ensure_render(const IManRenderer& renderer, int width) {
  int safe_width = std::max(1, width);
  if (cache_.width != safe_width || cache_.lines.empty()) {
    std::vector<std::string> lines;
    if (auto err = renderer.render(name_, section_, safe_width, lines)) {
      spdlog::info("render {} failed: {}", title(), err->message);
      return err;
    }
    cache_.width = safe_width;
    cache_.lines = std::move(lines);
    if (search_query_) refresh_search(scroll);
  }
  clamp_scroll_to_lines();
  return std::nullopt;
}

int ManPage::max_scroll(int viewport_height) const {
  int lines = line_count();
  if (lines == 0) return 0;
  return std::max(0, lines - std::max(1, viewport_height));
}

void ManPage::clamp_scroll_to_lines() {
  scroll = std::clamp(scroll, 0, std::max(0, line_count() - 1));
}

void ManPage::clamp_scroll(int viewport_height) {
  scroll = std::clamp(scroll, 0, max_scroll(viewport_height));
}

void ManPage::update_search(const std::optional<std::string>& query, int start_line) {
  if (!query || query->empty()) { clear_search(); return; }
  search_query_ = query;
  refresh_search(start_line);
}

void ManPage::clear_search() {
  search_query_.reset();
  search_matches_.clear();
  search_index_.reset();
}

std::optional<int> ManPage::next_match_line() {
  int count = (int)search_matches_.size();
  if (count == 0) { search_index_.reset(); return std::nullopt; }
  int next = search_index_ ? (*search_index_ + 1) % count : 0;
  search_index_ = next;
  return search_matches_[next].line;
}

std::optional<int> ManPage::previous_match_line() {
  int count = (int)search_matches_.size();
  if (count == 0) { search_index_.reset(); return std::nullopt; }
  int prev = search_index_ ? (*search_index_ + count - 1) % count : 0;
  search_index_ = prev;
  return search_matches_[prev].line;
}

std::optional<int> ManPage::current_match_line() const {
  if (!search_index_ || *search_index_ >= (int)search_matches_.size()) return std::nullopt;
  return search_matches_[*search_index_].line;
}

void ManPage::refresh_search(int start_line) {
  if (!search_query_) { search_matches_.clear(); search_index_.reset(); return; }
  search_matches_ = collect_matches(cache_.lines, *search_query_);
  if (search_matches_.empty()) { search_index_.reset(); return; }
  auto it = std::find_if(search_matches_.begin(), search_matches_.end(),
                         [start_line](const SearchMatch& m){ return m.line >= start_line; });
  search_index_ = it == search_matches_.end() ? 0 : (int)(it - search_matches_.begin());
}
