#pragma once
/*
 * TabRegistry
 *
 * Purpose: ordered set of open ManPages (insertion order = tab order) and the active tab.
 * Invariant: active_index() < size() whenever !empty(); an empty registry is valid.
 * Note: every open/close/cycle re-renders the newly active page at the current width.
 */
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "man_page.hpp"
#include "types.hpp"

class TabRegistry {
public:
  bool empty() const { return tabs_.empty(); }
  int size() const { return (int)tabs_.size(); }
  int active_index() const { return active_; }
  const std::vector<ManPage>& tabs() const { return tabs_; }
  ManPage* active();
  const ManPage* active() const;

  // Each name is opened as its own tab. A failing item is removed again;
  // its message goes to `failure` when the error is recoverable (or policy
  // is Status). A fault under FaultPolicy::Fatal aborts the batch and is returned.
  std::optional<RenderError> open(const std::vector<std::string>& names,
                                  const std::optional<std::string>& section,
                                  const IManRenderer& renderer,
                                  int width,
                                  int viewport_height,
                                  FaultPolicy policy,
                                  std::string& failure);

  std::optional<RenderError> close_active(const IManRenderer& renderer, int width, int viewport_height);
  std::optional<RenderError> cycle(Direction dir, const IManRenderer& renderer, int width, int viewport_height);
  std::optional<RenderError> refresh_active(const IManRenderer& renderer, int width, int viewport_height);

private:
  void remove_at(int idx);

  std::vector<ManPage> tabs_;
  int active_ = 0;
};
