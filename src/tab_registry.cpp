#include "tab_registry.hpp"
#include <spdlog/spdlog.h>

ManPage* TabRegistry::active() {
  if (active_ < 0 || active_ >= (int)tabs_.size()) return nullptr;
  return &tabs_[active_];
}

const ManPage* TabRegistry::active() const {
  if (active_ < 0 || active_ >= (int)tabs_.size()) return nullptr;
  return &tabs_[active_];
}

void TabRegistry::remove_at(int idx) {
  tabs_.erase(tabs_.begin() + idx);
  if (tabs_.empty()) { active_ = 0; return; }
  if (active_ >= (int)tabs_.size()) active_ = (int)tabs_.size() - 1;
}

std::optional<RenderError> TabRegistry::open(const std::vector<std::string>& names,
                                             const std::optional<std::string>& section,
                                             const IManRenderer& renderer,
                                             int width,
                                             int viewport_height,
                                             FaultPolicy policy,
                                             std::string& failure) {
  for (const auto& name : names) {
    tabs_.emplace_back(name, section);
    active_ = (int)tabs_.size() - 1;
    auto err = tabs_[active_].ensure_render(renderer, width);
    if (!err) {
      spdlog::info("opened tab {} ({} lines)", tabs_[active_].title(), tabs_[active_].line_count());
      continue;
    }
    remove_at(active_);
    if (err->recoverable() || policy == FaultPolicy::Status) {
      failure = err->message;
      continue;
    }
    return err;
  }
  // A failed item can leave an older tab active; it may hold a stale width.
  auto err = refresh_active(renderer, width, viewport_height);
  if (!err) return std::nullopt;
  if (err->recoverable() || policy == FaultPolicy::Status) {
    failure = err->message;
    return std::nullopt;
  }
  return err;
}

std::optional<RenderError> TabRegistry::close_active(const IManRenderer& renderer, int width, int viewport_height) {
  if (tabs_.empty()) return std::nullopt;
  spdlog::info("closing tab {}", tabs_[active_].title());
  remove_at(active_);
  return refresh_active(renderer, width, viewport_height);
}

std::optional<RenderError> TabRegistry::cycle(Direction dir, const IManRenderer& renderer, int width, int viewport_height) {
  if (tabs_.empty()) return std::nullopt;
  int n = (int)tabs_.size();
  if (dir == Direction::Left) active_ = active_ == 0 ? n - 1 : active_ - 1;
  else active_ = (active_ + 1) % n;
  return refresh_active(renderer, width, viewport_height);
}

std::optional<RenderError> TabRegistry::refresh_active(const IManRenderer& renderer, int width, int viewport_height) {
  ManPage* page = active();
  if (!page) return std::nullopt;
  if (auto err = page->ensure_render(renderer, width)) return err;
  page->clamp_scroll(viewport_height);
  return std::nullopt;
}
