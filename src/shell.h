#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hoist {

class cancellation;

struct shell_result {
  int exit_code;
  std::optional<int> signal;
  bool timed_out{ false };
  bool cancelled{ false };
};

enum class shell_stream { std_out, std_err };

struct shell_run_cfg {
  std::function<void(std::string_view)> on_stdout_line;
  std::function<void(std::string_view)> on_stderr_line;
  std::optional<std::filesystem::path> cwd;

  // Written to the child's stdin, which is then closed. Without it the child
  // reads /dev/null. Not owned: must outlive the call.
  std::optional<std::string_view> stdin_data;

  std::optional<std::chrono::steady_clock::time_point> deadline;
  cancellation const *cancel{ nullptr };

  // Time between SIGTERM and SIGKILL once the deadline passes or cancel is requested
  std::chrono::milliseconds kill_grace{ 5000 };
};

// Run argv[0] (searched on PATH) with argv as its arguments, streaming
// stdout/stderr line by line to the callbacks. The child runs in its own
// process group so termination reaches anything it spawns.
shell_result shell_run(std::vector<std::string> const &argv, shell_run_cfg const &cfg);

// Render argv for logs and traces: arguments with shell metacharacters are
// single-quoted.
std::string shell_format_argv(std::vector<std::string> const &argv);

}  // namespace hoist
