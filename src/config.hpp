#pragma once
/*
 * Config
 *
 * Purpose: startup options read from ~/.manifoldrc (one `set` command per line).
 * Note: rc errors never abort startup; they end up in the status line.
 */
#include <filesystem>
#include <string>
#include "cmd_registry.hpp"

#define MANIFOLD_RC_NAME ".manifoldrc"
#define MANIFOLD_LOG_ENV "MANIFOLD_LOG"

// What a non-recoverable render fault does while the pager is interactive.
enum class FaultPolicy { Fatal, Status };

struct Config {
  std::string log_path;           // empty: logging disabled
  std::string log_level = "info";
  std::string search_color = "cyan";
  std::string current_color = "yellow";
  bool tab_bar = true;
  FaultPolicy render_faults = FaultPolicy::Fatal;
};

bool is_color_name(const std::string& name);

void register_options(CommandRegistry& registry, Config& cfg);
bool execute_rc_line(const CommandRegistry& registry, const std::string& line, std::string& msg);
bool load_rc_file(const std::filesystem::path& path, Config& cfg, std::string& msg);
// Reads $HOME/.manifoldrc when present, then applies $MANIFOLD_LOG.
void load_rc(Config& cfg, std::string& msg);
