#pragma once
/*
 * Session
 *
 * Purpose: the pager's state machine. apply() takes one decoded Action plus the
 *          current geometry and updates tabs, mode, search and status.
 * Errors: recoverable render errors become the status message; a non-recoverable
 *         one is thrown as RenderFault (interactive opens follow FaultPolicy).
 * Invariant: after apply(), the active page has scroll <= its max_scroll(viewport_height).
 */
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "iargs_classifier.hpp"
#include "iman_renderer.hpp"
#include "tab_registry.hpp"
#include "types.hpp"

class Session {
public:
  explicit Session(const IArgsClassifier& classifier, FaultPolicy faults = FaultPolicy::Fatal);

  Outcome apply(const Action& action, const IManRenderer& renderer, int width, int viewport_height);

  // Startup arguments: none → empty session, one → that page, more → classified.
  // Faults always propagate here.
  void open_args(const std::vector<std::string>& args, const IManRenderer& renderer, int width, int viewport_height);
  void open_pages(const std::vector<std::string>& names, const std::optional<std::string>& section,
                  const IManRenderer& renderer, int width, int viewport_height);
  void resize(const IManRenderer& renderer, int width, int viewport_height);

  void scroll_up(int amount);
  void scroll_down(int amount, int viewport_height);
  void page_up(int viewport_height);
  void page_down(int viewport_height);
  void half_page_up(int viewport_height);
  void half_page_down(int viewport_height);
  void go_top();
  void go_bottom(int viewport_height);
  void center_on_line(int line, int viewport_height);

  bool has_tabs() const { return !tabs_.empty(); }
  std::string title() const;
  const std::vector<std::string>& lines() const;
  int scroll_offset() const;
  const Mode& mode() const { return mode_; }
  const std::optional<std::string>& status_message() const { return status_; }
  void set_status(std::string message) { status_ = std::move(message); }
  const TabRegistry& tabs() const { return tabs_; }
  const ManPage* active_page() const { return tabs_.active(); }
  int active_index() const { return tabs_.active_index(); }
  std::optional<std::string> search_query() const;

private:
  Outcome execute_command(const std::string& line, const IManRenderer& renderer, int width, int viewport_height);
  void open_internal(const std::vector<std::string>& names, const std::optional<std::string>& section,
                     const IManRenderer& renderer, int width, int viewport_height, FaultPolicy policy);
  void check(const std::optional<RenderError>& err);

  void enter_search_mode();
  void edit_line(const Action& action, int viewport_height);
  void search_submit(int viewport_height);
  void search_cancel(int viewport_height);
  void search_step(bool forward, int viewport_height);
  void apply_search(const std::string& query, int viewport_height);

  const IArgsClassifier& classifier_;
  FaultPolicy faults_;
  TabRegistry tabs_;
  Mode mode_ = NormalMode{};
  std::optional<std::string> status_;
};
