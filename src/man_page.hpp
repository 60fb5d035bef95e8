#pragma once
/*
 * ManPage
 *
 * Purpose: one opened page: identity, width-keyed render cache, scroll, search state.
 * Invariant: after a successful ensure_render, scroll <= max(0, line_count - 1);
 *            matches always refer to the lines currently in the cache.
 */
#include <optional>
#include <string>
#include <vector>
#include "iman_renderer.hpp"
#include "types.hpp"

struct RenderCache {
  int width = 0; // 0: never rendered
  std::vector<std::string> lines;
};

class ManPage {
public:
  ManPage(std::string name, std::optional<std::string> section);

  const std::string& name() const { return name_; }
  const std::optional<std::string>& section() const { return section_; }
  std::string title() const;

  const std::vector<std::string>& lines() const { return cache_.lines; }
  int line_count() const { return (int)cache_.lines.size(); }
  int render_width() const { return cache_.width; }

  // Re-renders only when the width changed or nothing is cached.
  // On error the cache is untouched and the error is returned.
  std::optional<RenderError> ensure_render(const IManRenderer& renderer, int width);

  int max_scroll(int viewport_height) const;
  void clamp_scroll_to_lines();
  void clamp_scroll(int viewport_height);

  void update_search(const std::optional<std::string>& query, int start_line);
  void clear_search();
  std::optional<int> next_match_line();
  std::optional<int> previous_match_line();
  std::optional<int> current_match_line() const;

  const std::optional<std::string>& search_query() const { return search_query_; }
  const std::vector<SearchMatch>& search_matches() const { return search_matches_; }
  std::optional<int> search_index() const { return search_index_; }

  int scroll = 0;

private:
  void refresh_search(int start_line);

  std::string name_;
  std::optional<std::string> section_;
  RenderCache cache_;
  std::optional<std::string> search_query_;
  std::vector<SearchMatch> search_matches_;
  std::optional<int> search_index_;
};
