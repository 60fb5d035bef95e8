#pragma once
/*
 * Pager
 *
 * Purpose: the event loop: draw, read one key, map it to an Action, apply it.
 * Note: geometry is re-read from the terminal on every key, so a KEY_RESIZE
 *       turns into a Resize action carrying the new size.
 */
#include <string>
#include <vector>
#include "iman_renderer.hpp"
#include "input.hpp"
#include "iterminal.hpp"
#include "session.hpp"
#include "view.hpp"

class Pager {
public:
  Pager(Session& session, const IManRenderer& renderer, ITerminal& term, const ViewOptions& opts);
  void open_startup(const std::vector<std::string>& args);
  void run();

  int width() const;
  int viewport_height() const;

private:
  void render();

  Session& session_;
  const IManRenderer& renderer_;
  ITerminal& term_;
  ViewOptions opts_;
  Input input_;
  View view_;
};
