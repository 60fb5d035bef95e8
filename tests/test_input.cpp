#include "input.hpp"
#include <cassert>
#include <ncurses.h>

using K = Action::Kind;

static K kind_of(Input& in, int ch, const Mode& mode = NormalMode{}) {
  auto a = in.map_key(ch, mode);
  assert(a);
  return a->kind;
}

static void test_normal_keys() {
  Input in;
  assert(kind_of(in, 'q') == K::Quit);
  assert(kind_of(in, 27) == K::Quit);
  assert(kind_of(in, 'j') == K::ScrollDown);
  assert(kind_of(in, KEY_DOWN) == K::ScrollDown);
  assert(kind_of(in, '\n') == K::ScrollDown);
  assert(kind_of(in, 'k') == K::ScrollUp);
  assert(kind_of(in, KEY_UP) == K::ScrollUp);
  assert(kind_of(in, ' ') == K::PageDown);
  assert(kind_of(in, KEY_NPAGE) == K::PageDown);
  assert(kind_of(in, 'b') == K::PageUp);
  assert(kind_of(in, KEY_PPAGE) == K::PageUp);
  assert(kind_of(in, 'D' - 64) == K::HalfPageDown);
  assert(kind_of(in, 'U' - 64) == K::HalfPageUp);
  assert(kind_of(in, 'g') == K::GoTop);
  assert(kind_of(in, KEY_HOME) == K::GoTop);
  assert(kind_of(in, 'G') == K::GoBottom);
  assert(kind_of(in, KEY_END) == K::GoBottom);
  assert(kind_of(in, 'h') == K::TabLeft);
  assert(kind_of(in, KEY_LEFT) == K::TabLeft);
  assert(kind_of(in, 'l') == K::TabRight);
  assert(kind_of(in, KEY_RIGHT) == K::TabRight);
  assert(kind_of(in, ':') == K::EnterCommandMode);
  assert(kind_of(in, '/') == K::EnterSearchMode);
  assert(kind_of(in, 'n') == K::SearchNext);
  assert(kind_of(in, 'N') == K::SearchPrev);
  assert(kind_of(in, 'L' - 64) == K::SearchClear);
  assert(kind_of(in, '?') == K::EnterHelp);
  assert(!in.map_key('z', NormalMode{}));
}

static void test_count_prefix() {
  Input in;
  assert(!in.map_key('1', NormalMode{}));
  assert(!in.map_key('2', NormalMode{}));
  assert(in.hasCount());
  auto a = in.map_key('j', NormalMode{});
  assert(a && a->kind == K::ScrollDown && a->amount == 12);
  assert(!in.hasCount());

  a = in.map_key('k', NormalMode{});
  assert(a && a->amount == 1);

  // leading zero is not a count
  assert(!in.map_key('0', NormalMode{}));
  assert(!in.hasCount());

  assert(!in.map_key('3', NormalMode{}));
  assert(!in.map_key('0', NormalMode{}));
  a = in.map_key('k', NormalMode{});
  assert(a && a->kind == K::ScrollUp && a->amount == 30);

  // count is consumed by any other key
  in.map_key('5', NormalMode{});
  assert(kind_of(in, 'G') == K::GoBottom);
  a = in.map_key('j', NormalMode{});
  assert(a && a->amount == 1);

  for (int i = 0; i < 12; ++i) in.map_key('9', NormalMode{});
  a = in.map_key('j', NormalMode{});
  assert(a && a->amount == 99999);
}

static void test_help_mode() {
  Input in;
  assert(kind_of(in, '?', HelpMode{}) == K::ExitHelp);
  assert(kind_of(in, 'q', HelpMode{}) == K::ExitHelp);
  assert(kind_of(in, 27, HelpMode{}) == K::ExitHelp);
  assert(!in.map_key('j', HelpMode{}));
}

static void test_line_modes() {
  Input in;
  Mode cmd = CommandMode{};
  Mode search = SearchMode{};
  assert(kind_of(in, 27, cmd) == K::CommandCancel);
  assert(kind_of(in, '\n', cmd) == K::CommandSubmit);
  assert(kind_of(in, KEY_ENTER, cmd) == K::CommandSubmit);
  assert(kind_of(in, KEY_BACKSPACE, cmd) == K::CommandBackspace);
  assert(kind_of(in, 127, cmd) == K::CommandBackspace);
  auto a = in.map_key('q', cmd);
  assert(a && a->kind == K::CommandChar && a->ch == 'q');

  assert(kind_of(in, 27, search) == K::SearchCancel);
  assert(kind_of(in, '\r', search) == K::SearchSubmit);
  assert(kind_of(in, 8, search) == K::SearchBackspace);
  a = in.map_key(' ', search);
  assert(a && a->kind == K::SearchChar && a->ch == ' ');
  a = in.map_key(0xC3, search);
  assert(a && a->kind == K::SearchChar);
  assert(!in.map_key(KEY_LEFT, search));
  assert(!in.map_key(1, search));
}

static void test_mode_switch_drops_count() {
  Input in;
  in.map_key('4', NormalMode{});
  in.map_key('x', CommandMode{});
  auto a = in.map_key('j', NormalMode{});
  assert(a && a->amount == 1);
}

static void test_scroll_factory_with_curses_header() {
  // <ncurses.h> is included above; its pseudo-functions must not touch these names
  Input in;
  in.map_key('3', NormalMode{});
  auto a = in.map_key('j', NormalMode{});
  assert(a && *a == Action::scroll_by(K::ScrollDown, 3));
  assert(Action::scroll_by(K::ScrollUp, 2).amount == 2);
}

int main() {
  test_normal_keys();
  test_count_prefix();
  test_help_mode();
  test_line_modes();
  test_mode_switch_drops_count();
  test_scroll_factory_with_curses_header();
  return 0;
}
