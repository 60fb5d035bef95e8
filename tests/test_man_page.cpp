#include "man_page.hpp"
#include <cassert>
#include "stubs.hpp"

static void test_cache_reuse_and_width_change() {
  CountingRenderer r;
  ManPage p("ls", std::nullopt);
  assert(p.render_width() == 0);
  assert(!p.ensure_render(r, 80));
  assert(!p.ensure_render(r, 80));
  assert(r.calls == 1);
  assert(p.lines().front() == "ls:80");
  assert(!p.ensure_render(r, 100));
  assert(r.calls == 2);
  assert(p.render_width() == 100);
  assert(p.lines().front() == "ls:100");
}

static void test_width_clamped_to_one() {
  CountingRenderer r;
  ManPage p("ls", std::nullopt);
  assert(!p.ensure_render(r, 0));
  assert(p.render_width() == 1);
  assert(!p.ensure_render(r, -5));
  assert(r.calls == 1);
}

static void test_failure_leaves_cache_untouched() {
  LinesRenderer good(numbered_lines(10));
  FailingRenderer bad(RenderError::Kind::NotFound);
  ManPage p("ls", std::nullopt);
  assert(!p.ensure_render(good, 80));
  auto err = p.ensure_render(bad, 60);
  assert(err && err->recoverable());
  assert(p.render_width() == 80);
  assert(p.line_count() == 10);
}

static void test_scroll_clamped_after_render() {
  LinesRenderer r(numbered_lines(10));
  ManPage p("ls", std::nullopt);
  p.scroll = 42;
  assert(!p.ensure_render(r, 80));
  assert(p.scroll == 9);
  assert(p.max_scroll(4) == 6);
  p.clamp_scroll(4);
  assert(p.scroll == 6);
  assert(p.max_scroll(0) == 9);
}

static void test_title() {
  assert(ManPage("read", std::string("2")).title() == "read(2)");
  assert(ManPage("ls", std::nullopt).title() == "ls");
}

static void test_search_anchor_and_wraparound() {
  std::vector<std::string> lines = numbered_lines(40);
  lines[5] = "foo a";
  lines[20] = "foo b foo";
  lines[35] = "foo c";
  LinesRenderer r(lines);
  ManPage p("x", std::nullopt);
  assert(!p.ensure_render(r, 80));

  p.update_search(std::string("foo"), 10);
  assert(p.search_matches().size() == 4);
  assert(p.search_index() == 1);
  assert(p.current_match_line() == 20);

  // k next steps return to the start
  int start = *p.search_index();
  for (int i = 0; i < 4; ++i) assert(p.next_match_line());
  assert(*p.search_index() == start);

  p.update_search(std::string("foo"), 0);
  assert(p.search_index() == 0);
  assert(p.previous_match_line() == 35);
  assert(p.search_index() == 3);

  // nothing at or after the anchor: wrap to the first match
  p.update_search(std::string("foo"), 39);
  assert(p.search_index() == 0);
}

static void test_search_no_matches_and_clear() {
  LinesRenderer r(numbered_lines(5));
  ManPage p("x", std::nullopt);
  assert(!p.ensure_render(r, 80));
  p.update_search(std::string("zzz"), 0);
  assert(p.search_query() == std::string("zzz"));
  assert(p.search_matches().empty());
  assert(!p.search_index());
  assert(!p.next_match_line());
  assert(!p.previous_match_line());

  p.update_search(std::string("line"), 0);
  assert(p.search_matches().size() == 5);
  p.update_search(std::string(""), 0);
  assert(!p.search_query());
  assert(p.search_matches().empty());

  p.update_search(std::string("line"), 0);
  p.update_search(std::nullopt, 0);
  assert(!p.search_query());

  p.clear_search();
  assert(!p.search_query() && !p.search_index());
}

static void test_rerender_reruns_search() {
  CountingRenderer r;
  ManPage p("ls", std::nullopt);
  assert(!p.ensure_render(r, 80));
  p.update_search(std::string(":80"), 0);
  assert(p.search_matches().size() == 50);
  assert(!p.ensure_render(r, 90));
  assert(p.search_query() == std::string(":80"));
  assert(p.search_matches().empty());
  assert(!p.search_index());
}

int main() {
  test_cache_reuse_and_width_change();
  test_width_clamped_to_one();
  test_failure_leaves_cache_untouched();
  test_scroll_clamped_after_render();
  test_title();
  test_search_anchor_and_wraparound();
  test_search_no_matches_and_clear();
  test_rerender_reruns_search();
  return 0;
}
