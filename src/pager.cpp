#include "pager.hpp"
#include <algorithm>
#include <ncurses.h>
#include <spdlog/spdlog.h>

Pager::Pager(Session& session, const IManRenderer& renderer, ITerminal& term, const ViewOptions& opts)
  : session_(session), renderer_(renderer), term_(term), opts_(opts) {}

int Pager::width() const {
  return std::max(1, term_.getSize().cols);
}

int Pager::viewport_height() const {
  TermSize sz = term_.getSize();
  return content_height(sz.rows, opts_.tab_bar && sz.rows > 1);
}

void Pager::open_startup(const std::vector<std::string>& args) {
  session_.open_args(args, renderer_, width(), viewport_height());
}

void Pager::render() {
  view_.render(term_, session_, opts_);
}

void Pager::run() {
  for (;;) {
    render();
    int ch = term_.read_key();
    if (ch == ERR) continue;
    std::optional<Action> action;
    if (ch == KEY_RESIZE) {
      TermSize sz = term_.getSize();
      action = Action::resize(sz.cols, sz.rows);
    } else {
      action = input_.map_key(ch, session_.mode());
    }
    if (!action) continue;
    if (session_.apply(*action, renderer_, width(), viewport_height()) == Outcome::Quit) {
      spdlog::info("quit");
      break;
    }
  }
}
