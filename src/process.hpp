#pragma once
/*
 * Process
 *
 * Purpose: spawn external commands (man, col) with posix_spawnp and collect output.
 * Note: stdin/stdout/stderr that are not wired to a pipe go to /dev/null so a
 *       child never writes into the curses screen.
 */
#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>
#include "posix_fd.hpp"

struct SpawnSpec {
  std::vector<std::string> argv;
  std::vector<std::pair<std::string, std::string>> env; // added/overridden variables
  int stdin_fd = -1;                                    // -1: /dev/null
  bool capture_stdout = false;
  bool capture_stderr = false;
};

struct ChildProcess {
  pid_t pid = -1;
  UniqueFd out; // valid when capture_stdout
  UniqueFd err; // valid when capture_stderr
};

bool spawn_process(const SpawnSpec& spec, ChildProcess& child, std::string& msg);
bool read_all(int fd, std::string& out, std::string& msg);
// Drains two pipes together so neither writer blocks on a full buffer.
bool read_both(int fd_a, std::string& out_a, int fd_b, std::string& out_b, std::string& msg);
// exit_code is the exit status, or 128 + signal number for a killed child.
bool wait_process(pid_t pid, int& exit_code, std::string& msg);
