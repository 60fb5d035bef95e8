#pragma once
#include <optional>
#include "types.hpp"
/*
 * Input
 *
 * Purpose: translate curses key codes into Actions for the current mode.
 * Extend: Normal mode accepts a count prefix for line scrolling (e.g. 5j).
 * Note: KEY_RESIZE is not mapped here; the pager reads the new geometry itself.
 */

class Input {
public:
  std::optional<Action> map_key(int ch, const Mode& mode);
  bool consumeDigit(int ch);
  bool hasCount() const;
  int takeCount();
  void reset();
private:
  std::optional<Action> map_normal(int ch);
  int pending_count_ = 0;
};
