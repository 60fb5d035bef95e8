#include "input.hpp"
#include <algorithm>
#include <ncurses.h>

static constexpr int CTRL_u = 'U'-64;
static constexpr int CTRL_d = 'D'-64;
static constexpr int CTRL_l = 'L'-64;
static constexpr int ESC = 27;
static constexpr int kMaxCount = 99999;

static bool is_enter(int ch) { return ch == '\n' || ch == '\r' || ch == KEY_ENTER; }
static bool is_backspace(int ch) { return ch == KEY_BACKSPACE || ch == 127 || ch == 8; }
// Bytes >= 128 are passed through so UTF-8 input reaches the line editor.
static bool is_text(int ch) { return ch >= 32 && ch < 256 && ch != 127; }

std::optional<Action> Input::map_key(int ch, const Mode& mode) {
  using K = Action::Kind;
  if (std::holds_alternative<NormalMode>(mode)) return map_normal(ch);
  reset();
  if (std::holds_alternative<HelpMode>(mode)) {
    if (ch == '?' || ch == 'q' || ch == ESC) return Action::of(K::ExitHelp);
    return std::nullopt;
  }
  bool search = std::holds_alternative<SearchMode>(mode);
  if (ch == ESC) return Action::of(search ? K::SearchCancel : K::CommandCancel);
  if (is_enter(ch)) return Action::of(search ? K::SearchSubmit : K::CommandSubmit);
  if (is_backspace(ch)) return Action::of(search ? K::SearchBackspace : K::CommandBackspace);
  if (is_text(ch)) return Action::character(search ? K::SearchChar : K::CommandChar, static_cast<char>(ch));
  return std::nullopt;
}

std::optional<Action> Input::map_normal(int ch) {
  using K = Action::Kind;
  if (consumeDigit(ch)) return std::nullopt;
  int n = takeCount();
  if (n == 0) n = 1;
  switch (ch) {
    case 'q': case ESC: return Action::of(K::Quit);
    case 'j': case KEY_DOWN: case '\n': case '\r': return Action::scroll_by(K::ScrollDown, n);
    case 'k': case KEY_UP: return Action::scroll_by(K::ScrollUp, n);
    case ' ': case KEY_NPAGE: return Action::of(K::PageDown);
    case 'b': case KEY_PPAGE: return Action::of(K::PageUp);
    case CTRL_d: return Action::of(K::HalfPageDown);
    case CTRL_u: return Action::of(K::HalfPageUp);
    case 'g': case KEY_HOME: return Action::of(K::GoTop);
    case 'G': case KEY_END: return Action::of(K::GoBottom);
    case 'h': case KEY_LEFT: return Action::of(K::TabLeft);
    case 'l': case KEY_RIGHT: return Action::of(K::TabRight);
    case ':': return Action::of(K::EnterCommandMode);
    case '/': return Action::of(K::EnterSearchMode);
    case 'n': return Action::of(K::SearchNext);
    case 'N': return Action::of(K::SearchPrev);
    case CTRL_l: return Action::of(K::SearchClear);
    case '?': return Action::of(K::EnterHelp);
    default: return std::nullopt;
  }
}

bool Input::consumeDigit(int ch) {
  if (ch >= '1' && ch <= '9') {
    pending_count_ = std::min(kMaxCount, pending_count_ * 10 + (ch - '0'));
    return true;
  }
  if (ch == '0' && pending_count_ > 0) {
    pending_count_ = std::min(kMaxCount, pending_count_ * 10);
    return true;
  }
  return false;
}

bool Input::hasCount() const {
  return pending_count_ > 0;
}

int Input::takeCount() {
  int c = pending_count_;
  pending_count_ = 0;
  return c;
}

void Input::reset() {
  pending_count_ = 0;
}
