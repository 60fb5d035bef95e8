#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/Action/SearchMatch/Outcome).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <optional>
#include <string>
#include <variant>

struct NormalMode {
  bool operator==(const NormalMode&) const = default;
};
struct HelpMode {
  bool operator==(const HelpMode&) const = default;
};
struct CommandMode {
  std::string line;
  bool operator==(const CommandMode&) const = default;
};
struct SearchMode {
  std::string line;
  std::optional<std::string> previous; // query active when the mode was entered
  bool operator==(const SearchMode&) const = default;
};

// Only Command/Search carry an editable line; switching mode drops it.
using Mode = std::variant<NormalMode, HelpMode, CommandMode, SearchMode>;

struct SearchMatch {
  int line = 0;
  int start = 0; // byte offsets into the line, [start, end)
  int end = 0;
  bool operator==(const SearchMatch&) const = default;
};

enum class Outcome { Continue, Quit };

enum class Direction { Left, Right };

struct Action {
  enum class Kind {
    Quit,
    ScrollUp,
    ScrollDown,
    PageUp,
    PageDown,
    HalfPageUp,
    HalfPageDown,
    Resize,
    GoTop,
    GoBottom,
    TabLeft,
    TabRight,
    EnterHelp,
    ExitHelp,
    EnterCommandMode,
    CommandChar,
    CommandBackspace,
    CommandSubmit,
    CommandCancel,
    EnterSearchMode,
    SearchChar,
    SearchBackspace,
    SearchSubmit,
    SearchCancel,
    SearchNext,
    SearchPrev,
    SearchClear,
  };

  Kind kind = Kind::Quit;
  int amount = 0; // ScrollUp/ScrollDown
  int width = 0;  // Resize
  int height = 0; // Resize
  char ch = 0;    // CommandChar/SearchChar

  static Action of(Kind k) { Action a; a.kind = k; return a; }
  static Action scroll_by(Kind k, int n) { Action a; a.kind = k; a.amount = n; return a; }
  static Action resize(int w, int h) { Action a; a.kind = Kind::Resize; a.width = w; a.height = h; return a; }
  static Action character(Kind k, char c) { Action a; a.kind = k; a.ch = c; return a; }

  bool operator==(const Action&) const = default;
};
