#include "system_man_renderer.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>
#include "file_reader.hpp"
#include "process.hpp"

static std::string trim(const std::string& s) {
  size_t i = 0, j = s.size();
  while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) i++;
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) j--;
  return s.substr(i, j - i);
}

static RenderError io_error(std::string message) {
  return RenderError{RenderError::Kind::Io, std::move(message)};
}

std::optional<RenderError> SystemManRenderer::render(const std::string& name,
                                                     const std::optional<std::string>& section,
                                                     int width,
                                                     std::vector<std::string>& out) const {
  int safe_width = std::max(1, width);
  SpawnSpec man_spec;
  man_spec.argv.push_back("man");
  if (section) man_spec.argv.push_back(*section);
  man_spec.argv.push_back(name);
  man_spec.env = {{"MANWIDTH", std::to_string(safe_width)}, {"MANPAGER", "cat"}};
  man_spec.capture_stdout = true;
  man_spec.capture_stderr = true;

  std::string msg;
  ChildProcess man;
  if (!spawn_process(man_spec, man, msg)) return io_error(msg);

  SpawnSpec col_spec;
  col_spec.argv = {"col", "-bx"};
  col_spec.stdin_fd = man.out.get();
  col_spec.capture_stdout = true;
  ChildProcess col;
  bool col_started = spawn_process(col_spec, col, msg);
  man.out.reset();
  if (!col_started) {
    int code = 0; std::string wait_msg;
    if (!wait_process(man.pid, code, wait_msg)) spdlog::warn("render {}: {}", name, wait_msg);
    return io_error(msg);
  }

  std::string text, err_text;
  bool read_ok = read_both(col.out.get(), text, man.err.get(), err_text, msg);
  col.out.reset();
  man.err.reset();

  int man_code = 0, col_code = 0;
  std::string wait_msg;
  if (!wait_process(man.pid, man_code, wait_msg)) return io_error(wait_msg);
  if (!wait_process(col.pid, col_code, wait_msg)) return io_error(wait_msg);
  if (!read_ok) return io_error(msg);

  if (man_code != 0) {
    std::string message = trim(err_text);
    if (message.empty()) message = "man exited with status " + std::to_string(man_code);
    return RenderError{RenderError::Kind::NotFound, message};
  }
  if (col_code != 0) return io_error("col exited with status " + std::to_string(col_code));

  split_lines(text, out);
  spdlog::debug("rendered {}{} at width {}: {} lines", name,
                section ? "(" + *section + ")" : std::string(), safe_width, out.size());
  return std::nullopt;
}
