#include "command.hpp"
#include <sstream>
#include <spdlog/spdlog.h>

static ParsedCommand unknown(const std::string& keyword) {
  ParsedCommand c;
  c.kind = ParsedCommand::Kind::Unknown;
  c.keyword = keyword;
  return c;
}

ParsedCommand interpret_man_args(const std::vector<std::string>& args, const IArgsClassifier& classifier) {
  ParsedCommand c;
  c.kind = ParsedCommand::Kind::Open;
  if (args.size() == 1) { c.pages = args; return c; }

  std::string msg;
  auto interp = classifier.classify(args, msg);
  if (!interp) {
    spdlog::warn("argument classification failed ({}), opening all as pages", msg);
    c.pages = args;
    return c;
  }
  c.pages = std::move(interp->pages);
  c.section = std::move(interp->section);
  return c;
}

ParsedCommand parse_command(const std::string& line, const IArgsClassifier& classifier) {
  std::istringstream iss(line);
  std::string cmd;
  if (!(iss >> cmd)) return ParsedCommand{};
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);

  if (cmd == "man") {
    if (args.empty()) return unknown(cmd);
    ParsedCommand c = interpret_man_args(args, classifier);
    if (c.pages.empty()) return unknown(cmd);
    return c;
  }
  ParsedCommand c;
  if (cmd == "help" || cmd == "h") c.kind = ParsedCommand::Kind::Help;
  else if (cmd == "quit" || cmd == "q") c.kind = ParsedCommand::Kind::Quit;
  else if (cmd == "wipe" || cmd == "w") c.kind = ParsedCommand::Kind::Wipe;
  else return unknown(cmd);
  return c;
}
