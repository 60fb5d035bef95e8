#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <vector>
#include "file_reader.hpp"

static std::string to_lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return s.substr(i, j - i);
}

bool is_color_name(const std::string& name) {
  static const std::vector<std::string> names = {
    "default", "black", "white", "red", "green", "blue", "yellow", "magenta", "cyan"
  };
  return std::find(names.begin(), names.end(), name) != names.end();
}

static bool parse_on_off(const std::vector<std::string>& args, const std::string& opt, bool& out, std::string& msg) {
  if (args.empty()) { msg = "set " + opt + ": use set " + opt + " on|off"; return false; }
  std::string v = to_lower(args[0]);
  if (v == "on" || v == "1" || v == "true") { out = true; return true; }
  if (v == "off" || v == "0" || v == "false") { out = false; return true; }
  msg = "set " + opt + ": value must be on|off";
  return false;
}

void register_options(CommandRegistry& registry, Config& cfg) {
  registry.register_command("set log", [&cfg](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set log: use set log <path>"; return false; }
    cfg.log_path = args[0];
    return true;
  });
  registry.register_command("set loglevel", [&cfg](const std::vector<std::string>& args, std::string& msg){
    static const std::vector<std::string> levels = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    if (args.empty()) { msg = "set loglevel: use set loglevel trace|debug|info|warn|error|off"; return false; }
    std::string v = to_lower(args[0]);
    if (std::find(levels.begin(), levels.end(), v) == levels.end()) { msg = "set loglevel: unknown level " + args[0]; return false; }
    cfg.log_level = v;
    return true;
  });
  registry.register_command("set searchcolor", [&cfg](const std::vector<std::string>& args, std::string& msg){
    if (args.empty() || !is_color_name(to_lower(args[0]))) { msg = "set searchcolor: unknown color"; return false; }
    cfg.search_color = to_lower(args[0]);
    return true;
  });
  registry.register_command("set currentcolor", [&cfg](const std::vector<std::string>& args, std::string& msg){
    if (args.empty() || !is_color_name(to_lower(args[0]))) { msg = "set currentcolor: unknown color"; return false; }
    cfg.current_color = to_lower(args[0]);
    return true;
  });
  registry.register_command("set tabbar", [&cfg](const std::vector<std::string>& args, std::string& msg){
    return parse_on_off(args, "tabbar", cfg.tab_bar, msg);
  });
  registry.register_command("set renderfaults", [&cfg](const std::vector<std::string>& args, std::string& msg){
    std::string v = args.empty() ? std::string() : to_lower(args[0]);
    if (v == "fatal") { cfg.render_faults = FaultPolicy::Fatal; return true; }
    if (v == "status") { cfg.render_faults = FaultPolicy::Status; return true; }
    msg = "set renderfaults: use set renderfaults fatal|status";
    return false;
  });
}

bool execute_rc_line(const CommandRegistry& registry, const std::string& line, std::string& msg) {
  std::istringstream iss(line);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd != "set" || args.empty()) { msg = "unknown command: " + cmd; return false; }
  std::string name = args[0];
  std::string value;
  size_t eq = name.find('=');
  if (eq != std::string::npos) {
    value = name.substr(eq + 1);
    name = name.substr(0, eq);
  }
  std::vector<std::string> subargs;
  if (!value.empty()) subargs.push_back(value);
  for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
  return registry.execute("set " + name, subargs, msg);
}

bool load_rc_file(const std::filesystem::path& path, Config& cfg, std::string& msg) {
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  CommandRegistry registry;
  register_options(registry, cfg);
  bool ok = true;
  for (size_t n = 0; n < lines.size(); ++n) {
    std::string s = trim(lines[n]);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s.erase(s.begin());
    std::string line_msg;
    if (!execute_rc_line(registry, s, line_msg)) {
      msg = path.filename().string() + ":" + std::to_string(n + 1) + ": " + line_msg;
      ok = false;
    }
  }
  return ok;
}

void load_rc(Config& cfg, std::string& msg) {
  if (const char* home = std::getenv("HOME")) {
    std::error_code ec;
    auto p = std::filesystem::path(home) / MANIFOLD_RC_NAME;
    if (std::filesystem::exists(p, ec)) {
      std::string rc_msg;
      if (!load_rc_file(p, cfg, rc_msg)) msg = rc_msg;
    }
  }
  if (const char* log = std::getenv(MANIFOLD_LOG_ENV)) {
    if (*log) cfg.log_path = log;
  }
}
