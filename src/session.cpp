#include "session.hpp"
#include <algorithm>
#include <utility>
#include <spdlog/spdlog.h>
#include "command.hpp"

Session::Session(const IArgsClassifier& classifier, FaultPolicy faults)
  : classifier_(classifier), faults_(faults) {}

static bool should_clear_status(const Action& action) {
  return action.kind != Action::Kind::Resize && action.kind != Action::Kind::Quit;
}

Outcome Session::apply(const Action& action, const IManRenderer& renderer, int width, int viewport_height) {
  using K = Action::Kind;
  if (status_ && should_clear_status(action)) status_.reset();
  switch (action.kind) {
    case K::Quit: return Outcome::Quit;
    case K::ScrollUp: scroll_up(action.amount); break;
    case K::ScrollDown: scroll_down(action.amount, viewport_height); break;
    case K::PageUp: page_up(viewport_height); break;
    case K::PageDown: page_down(viewport_height); break;
    case K::HalfPageUp: half_page_up(viewport_height); break;
    case K::HalfPageDown: half_page_down(viewport_height); break;
    case K::Resize: resize(renderer, width, viewport_height); break;
    case K::GoTop: go_top(); break;
    case K::GoBottom: go_bottom(viewport_height); break;
    case K::TabLeft: check(tabs_.cycle(Direction::Left, renderer, width, viewport_height)); break;
    case K::TabRight: check(tabs_.cycle(Direction::Right, renderer, width, viewport_height)); break;
    case K::EnterHelp: mode_ = HelpMode{}; break;
    case K::ExitHelp: mode_ = NormalMode{}; break;
    case K::EnterCommandMode: mode_ = CommandMode{}; break;
    case K::CommandChar:
    case K::CommandBackspace:
    case K::SearchChar:
    case K::SearchBackspace: edit_line(action, viewport_height); break;
    case K::CommandCancel: mode_ = NormalMode{}; break;
    case K::CommandSubmit: {
      // Back to Normal before the command runs.
      Mode prev = std::exchange(mode_, NormalMode{});
      std::string line;
      if (auto* cm = std::get_if<CommandMode>(&prev)) line = cm->line;
      else if (auto* sm = std::get_if<SearchMode>(&prev)) line = sm->line;
      return execute_command(line, renderer, width, viewport_height);
    }
    case K::EnterSearchMode: enter_search_mode(); break;
    case K::SearchSubmit: search_submit(viewport_height); break;
    case K::SearchCancel: search_cancel(viewport_height); break;
    case K::SearchNext: search_step(true, viewport_height); break;
    case K::SearchPrev: search_step(false, viewport_height); break;
    case K::SearchClear:
      if (ManPage* page = tabs_.active()) page->clear_search();
      break;
  }
  return Outcome::Continue;
}

void Session::check(const std::optional<RenderError>& err) {
  if (!err) return;
  if (err->recoverable()) { status_ = err->message; return; }
  spdlog::error("render fault: {}", err->message);
  throw RenderFault(*err);
}

void Session::open_args(const std::vector<std::string>& args, const IManRenderer& renderer, int width, int viewport_height) {
  if (args.empty()) return;
  ParsedCommand c = interpret_man_args(args, classifier_);
  spdlog::info("startup: {} page(s){}", c.pages.size(), c.section ? " in section " + *c.section : std::string());
  open_internal(c.pages, c.section, renderer, width, viewport_height, FaultPolicy::Fatal);
}

void Session::open_pages(const std::vector<std::string>& names, const std::optional<std::string>& section,
                         const IManRenderer& renderer, int width, int viewport_height) {
  open_internal(names, section, renderer, width, viewport_height, FaultPolicy::Fatal);
}

void Session::open_internal(const std::vector<std::string>& names, const std::optional<std::string>& section,
                            const IManRenderer& renderer, int width, int viewport_height, FaultPolicy policy) {
  std::string failure;
  auto fault = tabs_.open(names, section, renderer, width, viewport_height, policy, failure);
  if (!failure.empty()) status_ = failure;
  check(fault);
}

void Session::resize(const IManRenderer& renderer, int width, int viewport_height) {
  check(tabs_.refresh_active(renderer, width, viewport_height));
}

Outcome Session::execute_command(const std::string& line, const IManRenderer& renderer, int width, int viewport_height) {
  ParsedCommand c = parse_command(line, classifier_);
  switch (c.kind) {
    case ParsedCommand::Kind::Open:
      open_internal(c.pages, c.section, renderer, width, viewport_height, faults_);
      break;
    case ParsedCommand::Kind::Help: mode_ = HelpMode{}; break;
    case ParsedCommand::Kind::Quit: return Outcome::Quit;
    case ParsedCommand::Kind::Wipe: check(tabs_.close_active(renderer, width, viewport_height)); break;
    case ParsedCommand::Kind::Empty: break;
    case ParsedCommand::Kind::Unknown:
      spdlog::info("unknown command '{}'", c.keyword);
      status_ = "Unknown command '" + c.keyword + "'";
      break;
  }
  return Outcome::Continue;
}

void Session::scroll_up(int amount) {
  ManPage* page = tabs_.active();
  if (!page) return;
  page->scroll = std::max(0, page->scroll - std::max(0, amount));
}

void Session::scroll_down(int amount, int viewport_height) {
  ManPage* page = tabs_.active();
  if (!page) return;
  page->scroll = std::min(page->scroll + std::max(0, amount), page->max_scroll(viewport_height));
}

void Session::page_up(int viewport_height) { scroll_up(viewport_height); }
void Session::page_down(int viewport_height) { scroll_down(viewport_height, viewport_height); }
void Session::half_page_up(int viewport_height) { scroll_up(std::max(1, viewport_height / 2)); }
void Session::half_page_down(int viewport_height) { scroll_down(std::max(1, viewport_height / 2), viewport_height); }

void Session::go_top() {
  if (ManPage* page = tabs_.active()) page->scroll = 0;
}

void Session::go_bottom(int viewport_height) {
  if (ManPage* page = tabs_.active()) page->scroll = page->max_scroll(viewport_height);
}

void Session::center_on_line(int line, int viewport_height) {
  ManPage* page = tabs_.active();
  if (!page) return;
  page->scroll = std::clamp(line - viewport_height / 2, 0, page->max_scroll(viewport_height));
}

void Session::enter_search_mode() {
  const ManPage* page = tabs_.active();
  if (!page) return;
  mode_ = SearchMode{std::string(), page->search_query()};
}

void Session::edit_line(const Action& action, int viewport_height) {
  using K = Action::Kind;
  if (auto* cm = std::get_if<CommandMode>(&mode_)) {
    if (action.kind == K::CommandChar) cm->line.push_back(action.ch);
    else if (action.kind == K::CommandBackspace && !cm->line.empty()) cm->line.pop_back();
    return;
  }
  if (auto* sm = std::get_if<SearchMode>(&mode_)) {
    if (action.kind == K::SearchChar) sm->line.push_back(action.ch);
    else if (action.kind == K::SearchBackspace && !sm->line.empty()) sm->line.pop_back();
    else return;
    std::string query = sm->line;
    apply_search(query, viewport_height);
  }
}

void Session::search_submit(int viewport_height) {
  auto* sm = std::get_if<SearchMode>(&mode_);
  if (!sm) return;
  std::string query = sm->line;
  apply_search(query, viewport_height);
  mode_ = NormalMode{};
}

void Session::search_cancel(int viewport_height) {
  auto* sm = std::get_if<SearchMode>(&mode_);
  if (!sm) return;
  std::optional<std::string> previous = sm->previous;
  if (previous) apply_search(*previous, viewport_height);
  else if (ManPage* page = tabs_.active()) page->clear_search();
  mode_ = NormalMode{};
}

void Session::search_step(bool forward, int viewport_height) {
  ManPage* page = tabs_.active();
  if (!page) return;
  auto line = forward ? page->next_match_line() : page->previous_match_line();
  if (line) center_on_line(*line, viewport_height);
}

void Session::apply_search(const std::string& query, int viewport_height) {
  ManPage* page = tabs_.active();
  if (!page) return;
  page->update_search(query, page->scroll);
  if (auto line = page->current_match_line()) center_on_line(*line, viewport_height);
}

std::string Session::title() const {
  const ManPage* page = tabs_.active();
  return page ? page->title() : std::string("manifold");
}

const std::vector<std::string>& Session::lines() const {
  static const std::vector<std::string> none;
  const ManPage* page = tabs_.active();
  return page ? page->lines() : none;
}

int Session::scroll_offset() const {
  const ManPage* page = tabs_.active();
  return page ? page->scroll : 0;
}

std::optional<std::string> Session::search_query() const {
  if (const ManPage* page = tabs_.active()) return page->search_query();
  return std::nullopt;
}
