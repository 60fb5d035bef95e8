#include "pager.hpp"
#include <cassert>
#include <ncurses.h>
#include "headless_terminal.hpp"
#include "stubs.hpp"

static void test_scripted_session() {
  HeadlessTerminal term(12, 40);
  LinesRenderer r(numbered_lines(100));
  StubClassifier cls;
  Session s(cls);
  Pager pager(s, r, term, ViewOptions{});
  assert(pager.width() == 40);
  assert(pager.viewport_height() == 10);

  pager.open_startup({"ls"});
  term.push_keys("5j:man cat\nh");
  term.push_keys("q");
  pager.run();
  assert(s.tabs().size() == 2);
  assert(s.active_index() == 0);
  assert(s.scroll_offset() == 5);
  assert(term.row_text(0) == " ls  cat");
  assert(term.row_text(1) == "line 5");
}

static void test_search_and_escape_quits() {
  HeadlessTerminal term(12, 40);
  std::vector<std::string> lines = numbered_lines(60);
  lines[40] = "target";
  LinesRenderer r(lines);
  StubClassifier cls;
  Session s(cls);
  Pager pager(s, r, term, ViewOptions{});
  pager.open_startup({"p"});
  // script runs out: ESC leaves search mode, the next ESC quits
  term.push_keys("/target");
  pager.run();
  assert(std::holds_alternative<NormalMode>(s.mode()));
  assert(!s.search_query());
  assert(s.scroll_offset() == 35);
}

static void test_resize_rerenders() {
  HeadlessTerminal term(12, 40);
  CountingRenderer r;
  StubClassifier cls;
  Session s(cls);
  Pager pager(s, r, term, ViewOptions{});
  pager.open_startup({"ls"});
  assert(s.lines().front() == "ls:40");
  term.resize(20, 70);
  term.push_key(KEY_RESIZE);
  term.push_keys("G");
  pager.run();
  assert(s.lines().front() == "ls:70");
  assert(s.scroll_offset() == 50 - 18);
}

static void test_quit_command_and_help() {
  HeadlessTerminal term(30, 60);
  CountingRenderer r;
  StubClassifier cls;
  Session s(cls);
  Pager pager(s, r, term, ViewOptions{false});
  assert(pager.viewport_height() == 29);
  term.push_keys("?jq:man ls\n:quit\n");
  pager.run();
  assert(s.tabs().size() == 1);
  assert(s.title() == "ls");
}

int main() {
  test_scripted_session();
  test_search_and_escape_quits();
  test_resize_rerenders();
  test_quit_command_and_help();
  return 0;
}
