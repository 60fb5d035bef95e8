#pragma once
/*
 * Command
 *
 * Purpose: parse a submitted command line into a structured command.
 * Grammar: `man [SECTION] NAME...`, `help`/`h`, `quit`/`q`, `wipe`/`w`, empty line.
 */
#include <optional>
#include <string>
#include <vector>
#include "iargs_classifier.hpp"

struct ParsedCommand {
  enum class Kind { Open, Help, Quit, Wipe, Empty, Unknown };
  Kind kind = Kind::Empty;
  std::vector<std::string> pages;     // Open
  std::optional<std::string> section; // Open
  std::string keyword;                // Unknown

  bool operator==(const ParsedCommand&) const = default;
};

// Turns `man` arguments (or startup arguments) into an Open command. Two or
// more tokens go through the classifier; a classifier failure falls back to
// treating every token as a page name.
ParsedCommand interpret_man_args(const std::vector<std::string>& args, const IArgsClassifier& classifier);

ParsedCommand parse_command(const std::string& line, const IArgsClassifier& classifier);
