#include "process.hpp"
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

extern char** environ;

namespace {

class FileActions {
public:
  FileActions() { ok_ = ::posix_spawn_file_actions_init(&fa_) == 0; }
  ~FileActions() { if (ok_) ::posix_spawn_file_actions_destroy(&fa_); }
  FileActions(const FileActions&) = delete;
  FileActions& operator=(const FileActions&) = delete;
  bool ok() const { return ok_; }
  posix_spawn_file_actions_t* get() { return &fa_; }
private:
  posix_spawn_file_actions_t fa_;
  bool ok_ = false;
};

std::vector<std::string> build_environment(const SpawnSpec& spec) {
  std::vector<std::string> env;
  for (char** e = environ; e && *e; ++e) {
    std::string entry(*e);
    size_t eq = entry.find('=');
    std::string key = entry.substr(0, eq);
    bool overridden = false;
    for (const auto& kv : spec.env) if (kv.first == key) { overridden = true; break; }
    if (!overridden) env.push_back(std::move(entry));
  }
  for (const auto& kv : spec.env) env.push_back(kv.first + "=" + kv.second);
  return env;
}

std::vector<char*> as_argv(std::vector<std::string>& items) {
  std::vector<char*> out;
  out.reserve(items.size() + 1);
  for (auto& s : items) out.push_back(s.data());
  out.push_back(nullptr);
  return out;
}

}  // namespace

bool spawn_process(const SpawnSpec& spec, ChildProcess& child, std::string& msg) {
  if (spec.argv.empty()) { msg = "spawn: empty command"; return false; }
  FileActions fa;
  if (!fa.ok()) { msg = "spawn: cannot init file actions"; return false; }

  Pipe out_pipe, err_pipe;
  if (spec.capture_stdout && !out_pipe.open()) { msg = std::string("pipe failed: ") + std::strerror(errno); return false; }
  if (spec.capture_stderr && !err_pipe.open()) { msg = std::string("pipe failed: ") + std::strerror(errno); return false; }

  int rc = 0;
  if (spec.stdin_fd >= 0) rc |= ::posix_spawn_file_actions_adddup2(fa.get(), spec.stdin_fd, STDIN_FILENO);
  else rc |= ::posix_spawn_file_actions_addopen(fa.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  if (spec.capture_stdout) rc |= ::posix_spawn_file_actions_adddup2(fa.get(), out_pipe.write_end.get(), STDOUT_FILENO);
  else rc |= ::posix_spawn_file_actions_addopen(fa.get(), STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
  if (spec.capture_stderr) rc |= ::posix_spawn_file_actions_adddup2(fa.get(), err_pipe.write_end.get(), STDERR_FILENO);
  else rc |= ::posix_spawn_file_actions_addopen(fa.get(), STDERR_FILENO, "/dev/null", O_WRONLY, 0);
  if (rc != 0) { msg = "spawn: cannot set up file actions"; return false; }

  std::vector<std::string> args = spec.argv;
  std::vector<std::string> env = build_environment(spec);
  std::vector<char*> argv = as_argv(args);
  std::vector<char*> envp = as_argv(env);

  pid_t pid = -1;
  int err = ::posix_spawnp(&pid, argv[0], fa.get(), nullptr, argv.data(), envp.data());
  if (err != 0) {
    msg = "cannot run " + spec.argv[0] + ": " + std::strerror(err);
    return false;
  }
  child.pid = pid;
  if (spec.capture_stdout) child.out = std::move(out_pipe.read_end);
  if (spec.capture_stderr) child.err = std::move(err_pipe.read_end);
  return true;
}

bool read_all(int fd, std::string& out, std::string& msg) {
  char chunk[8192];
  for (;;) {
    ssize_t n = ::read(fd, chunk, sizeof(chunk));
    if (n > 0) { out.append(chunk, static_cast<size_t>(n)); continue; }
    if (n == 0) return true;
    if (errno == EINTR) continue;
    msg = std::string("read failed: ") + std::strerror(errno);
    return false;
  }
}

bool read_both(int fd_a, std::string& out_a, int fd_b, std::string& out_b, std::string& msg) {
  struct pollfd fds[2] = {{fd_a, POLLIN, 0}, {fd_b, POLLIN, 0}};
  std::string* outs[2] = {&out_a, &out_b};
  char chunk[8192];
  int open_count = 0;
  for (auto& p : fds) if (p.fd >= 0) open_count++;
  while (open_count > 0) {
    int r = ::poll(fds, 2, -1);
    if (r < 0) {
      if (errno == EINTR) continue;
      msg = std::string("poll failed: ") + std::strerror(errno);
      return false;
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) continue;
      ssize_t n = ::read(fds[i].fd, chunk, sizeof(chunk));
      if (n > 0) { outs[i]->append(chunk, static_cast<size_t>(n)); continue; }
      if (n < 0 && errno == EINTR) continue;
      if (n < 0) {
        msg = std::string("read failed: ") + std::strerror(errno);
        return false;
      }
      fds[i].fd = -1; // EOF; poll ignores negative descriptors
      open_count--;
    }
  }
  return true;
}

bool wait_process(pid_t pid, int& exit_code, std::string& msg) {
  int status = 0;
  for (;;) {
    pid_t r = ::waitpid(pid, &status, 0);
    if (r == pid) break;
    if (r < 0 && errno == EINTR) continue;
    msg = std::string("waitpid failed: ") + std::strerror(errno);
    return false;
  }
  if (WIFEXITED(status)) exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status)) exit_code = 128 + WTERMSIG(status);
  else exit_code = -1;
  return true;
}
