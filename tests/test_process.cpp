#include "process.hpp"
#include <cassert>
#include "man_args_classifier.hpp"

static void test_capture_stdout() {
  SpawnSpec spec;
  spec.argv = {"printf", "a\\nb\\n"};
  spec.capture_stdout = true;
  ChildProcess child;
  std::string msg;
  assert(spawn_process(spec, child, msg));
  std::string out;
  assert(read_all(child.out.get(), out, msg));
  int code = -1;
  assert(wait_process(child.pid, code, msg));
  assert(code == 0);
  assert(out == "a\nb\n");
}

static void test_exit_status_and_stderr() {
  SpawnSpec spec;
  spec.argv = {"sh", "-c", "echo oops >&2; exit 3"};
  spec.capture_stderr = true;
  ChildProcess child;
  std::string msg;
  assert(spawn_process(spec, child, msg));
  assert(!child.out.valid());
  std::string err;
  assert(read_all(child.err.get(), err, msg));
  int code = 0;
  assert(wait_process(child.pid, code, msg));
  assert(code == 3);
  assert(err == "oops\n");
}

static void test_env_override_and_pipeline() {
  SpawnSpec first;
  first.argv = {"sh", "-c", "printf '%s' \"$MANIFOLD_TEST_VALUE\""};
  first.env = {{"MANIFOLD_TEST_VALUE", "piped"}};
  first.capture_stdout = true;
  ChildProcess a;
  std::string msg;
  assert(spawn_process(first, a, msg));

  SpawnSpec second;
  second.argv = {"cat"};
  second.stdin_fd = a.out.get();
  second.capture_stdout = true;
  ChildProcess b;
  assert(spawn_process(second, b, msg));
  a.out.reset();

  std::string out;
  assert(read_all(b.out.get(), out, msg));
  int code = -1;
  assert(wait_process(a.pid, code, msg) && code == 0);
  assert(wait_process(b.pid, code, msg) && code == 0);
  assert(out == "piped");
}

static void test_drain_both_pipes() {
  // stderr well past a pipe buffer before stdout closes
  SpawnSpec spec;
  spec.argv = {"sh", "-c", "head -c 200000 /dev/zero | tr '\\0' e >&2; echo done"};
  spec.capture_stdout = true;
  spec.capture_stderr = true;
  ChildProcess child;
  std::string msg;
  assert(spawn_process(spec, child, msg));
  std::string out, err;
  assert(read_both(child.out.get(), out, child.err.get(), err, msg));
  int code = -1;
  assert(wait_process(child.pid, code, msg));
  assert(code == 0);
  assert(out == "done\n");
  assert(err.size() == 200000);
  assert(err.find_first_not_of('e') == std::string::npos);
}

static void test_missing_program() {
  SpawnSpec spec;
  spec.argv = {"manifold-no-such-program"};
  ChildProcess child;
  std::string msg;
  assert(!spawn_process(spec, child, msg));
  assert(msg.find("cannot run manifold-no-such-program") == 0);

  SpawnSpec empty;
  assert(!spawn_process(empty, child, msg));
}

static void test_classifier_short_args() {
  ManArgsClassifier cls;
  std::string msg;
  auto r = cls.classify({"ls"}, msg);
  assert(r && !r->section);
  assert((r->pages == std::vector<std::string>{"ls"}));
}

int main() {
  test_capture_stdout();
  test_exit_status_and_stderr();
  test_env_override_and_pipeline();
  test_drain_both_pipes();
  test_missing_program();
  test_classifier_short_args();
  return 0;
}
