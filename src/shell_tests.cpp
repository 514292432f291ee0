#if defined(_WIN32)
#error POSIX-only
#endif

#include "shell.h"

#include "cancellation.h"

#include <doctest/doctest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace {

struct collected {
  hoist::shell_result result;
  std::vector<std::string> out;
  std::vector<std::string> err;
};

collected run_collect(std::vector<std::string> const &argv, hoist::shell_run_cfg cfg = {}) {
  collected c{};
  cfg.on_stdout_line = [&](std::string_view line) { c.out.emplace_back(line); };
  cfg.on_stderr_line = [&](std::string_view line) { c.err.emplace_back(line); };
  c.result = hoist::shell_run(argv, cfg);
  return c;
}

}  // namespace

TEST_CASE("shell_run streams stdout and stderr separately") {
  auto const c{ run_collect({ "sh", "-c", "echo first; echo oops >&2; printf 'second\\n'" }) };
  CHECK(c.result.exit_code == 0);
  CHECK_FALSE(c.result.signal.has_value());
  CHECK(c.out == std::vector<std::string>{ "first", "second" });
  CHECK(c.err == std::vector<std::string>{ "oops" });
}

TEST_CASE("shell_run reports the exit code") {
  auto const c{ run_collect({ "sh", "-c", "exit 7" }) };
  CHECK(c.result.exit_code == 7);
  CHECK_FALSE(c.result.timed_out);
}

TEST_CASE("shell_run passes arguments without a shell") {
  auto const c{ run_collect({ "printf", "%s|", "a b", "$HOME" }) };
  REQUIRE(c.out.size() == 1);
  CHECK(c.out[0] == "a b|$HOME|");
}

TEST_CASE("shell_run feeds stdin_data and closes stdin") {
  std::string const input{ "token-on-stdin\n" };
  hoist::shell_run_cfg cfg{};
  cfg.stdin_data = input;
  auto const c{ run_collect({ "cat" }, cfg) };
  CHECK(c.result.exit_code == 0);
  CHECK(c.out == std::vector<std::string>{ "token-on-stdin" });
}

TEST_CASE("shell_run without stdin_data reads /dev/null") {
  auto const c{ run_collect({ "cat" }) };
  CHECK(c.result.exit_code == 0);
  CHECK(c.out.empty());
}

TEST_CASE("shell_run reports a missing executable as 127") {
  auto const c{ run_collect({ "hoist-definitely-not-a-command" }) };
  CHECK(c.result.exit_code == 127);
}

TEST_CASE("shell_run kills the child at the deadline") {
  hoist::shell_run_cfg cfg{};
  cfg.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds{ 200 };
  cfg.kill_grace = std::chrono::milliseconds{ 200 };

  auto const start{ std::chrono::steady_clock::now() };
  auto const c{ run_collect({ "sleep", "30" }, cfg) };
  auto const elapsed{ std::chrono::steady_clock::now() - start };

  CHECK(c.result.timed_out);
  CHECK_FALSE(c.result.cancelled);
  CHECK(elapsed < std::chrono::seconds{ 10 });
}

TEST_CASE("shell_run stops the child on cancellation") {
  hoist::cancellation cancel;
  hoist::shell_run_cfg cfg{};
  cfg.cancel = &cancel;
  cfg.kill_grace = std::chrono::milliseconds{ 200 };

  std::thread canceller{ [&] {
    std::this_thread::sleep_for(std::chrono::milliseconds{ 100 });
    cancel.cancel();
  } };
  auto const c{ run_collect({ "sleep", "30" }, cfg) };
  canceller.join();

  CHECK(c.result.cancelled);
  CHECK_FALSE(c.result.timed_out);
}

TEST_CASE("shell_format_argv quotes only when needed") {
  CHECK(hoist::shell_format_argv({ "docker", "buildx", "build", "--platform",
                                   "linux/amd64,linux/arm64" }) ==
        "docker buildx build --platform linux/amd64,linux/arm64");
  CHECK(hoist::shell_format_argv({ "echo", "a b", "it's", "" }) ==
        "echo 'a b' 'it'\\''s' ''");
}

TEST_CASE("cancellation sleep_for returns early when cancelled") {
  hoist::cancellation cancel;
  CHECK(cancel.sleep_for(std::chrono::milliseconds{ 10 }));

  cancel.cancel();
  auto const start{ std::chrono::steady_clock::now() };
  CHECK_FALSE(cancel.sleep_for(std::chrono::seconds{ 10 }));
  CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds{ 1 });
}
