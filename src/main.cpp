#include <cstdio>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "config.hpp"
#include "logging.hpp"
#include "man_args_classifier.hpp"
#include "ncurses_terminal.hpp"
#include "pager.hpp"
#include "session.hpp"
#include "system_man_renderer.hpp"
#include "terminal.hpp"

int main(int argc, char** argv) {
  Config cfg;
  std::string startup_msg;
  load_rc(cfg, startup_msg);
  std::string log_msg;
  if (!init_logging(cfg, log_msg)) startup_msg = log_msg;

  std::vector<std::string> args(argv + 1, argv + argc);
  spdlog::info("starting with {} argument(s)", args.size());

  SystemManRenderer renderer;
  ManArgsClassifier classifier;
  Session session(classifier, cfg.render_faults);
  if (!startup_msg.empty()) session.set_status(startup_msg);

  try {
    Terminal term;
    NcursesTerminal screen;
    screen.setSearchHighlight(cfg.search_color);
    screen.setCurrentHighlight(cfg.current_color);
    ViewOptions opts;
    opts.tab_bar = cfg.tab_bar;
    Pager pager(session, renderer, screen, opts);
    pager.open_startup(args);
    pager.run();
  } catch (const RenderFault& e) {
    spdlog::critical("exiting: {}", e.what());
    spdlog::shutdown();
    std::fprintf(stderr, "manifold: %s\n", e.what());
    return 1;
  } catch (const std::exception& e) {
    spdlog::critical("unexpected error: {}", e.what());
    spdlog::shutdown();
    std::fprintf(stderr, "manifold: %s\n", e.what());
    return 1;
  }
  spdlog::shutdown();
  return 0;
}
