#include "docker_engine.h"

#include "shell.h"
#include "sha256.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <utility>

namespace hoist {

namespace {

constexpr size_t kStderrTailLines{ 20 };

// Keeps the last few stderr lines for BuildFailed/PushFailed reports
class line_tail {
 public:
  void push(std::string_view line) {
    lines_.emplace_back(line);
    if (lines_.size() > kStderrTailLines) { lines_.pop_front(); }
  }

  std::string str() const {
    std::string out;
    for (auto const &l : lines_) {
      if (!out.empty()) { out.push_back('\n'); }
      out.append(l);
    }
    return out;
  }

 private:
  std::deque<std::string> lines_;
};

struct run_request {
  std::string subject;
  std::vector<std::string> argv;
  std::optional<std::string_view> stdin_data;
  std::function<void(std::string_view)> on_line;
};

engine_result run_engine(run_request const &req, call_limits const &call) {
  line_tail tail;
  auto const command{ shell_format_argv(req.argv) };
  tui::debug("[%s] %s", req.subject.c_str(), command.c_str());
  HOIST_TRACE_PROCESS_START(req.subject, command);

  auto const start{ std::chrono::steady_clock::now() };
  shell_result const result{ shell_run(
      req.argv,
      shell_run_cfg{ .on_stdout_line =
                         [&](std::string_view line) {
                           tui::debug("[%s] %.*s",
                                      req.subject.c_str(),
                                      static_cast<int>(line.size()),
                                      line.data());
                           if (req.on_line) { req.on_line(line); }
                         },
                     .on_stderr_line =
                         [&](std::string_view line) {
                           tui::debug("[%s] %.*s",
                                      req.subject.c_str(),
                                      static_cast<int>(line.size()),
                                      line.data());
                           tail.push(line);
                           if (req.on_line) { req.on_line(line); }
                         },
                     .cwd = std::nullopt,
                     .stdin_data = req.stdin_data,
                     .deadline = call.deadline,
                     .cancel = call.cancel }) };

  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };
  HOIST_TRACE_PROCESS_EXIT(req.subject,
                           result.exit_code,
                           static_cast<std::int64_t>(duration_ms),
                           result.timed_out,
                           result.cancelled);

  return engine_result{ .exit_code = result.exit_code,
                        .timed_out = result.timed_out,
                        .cancelled = result.cancelled,
                        .stderr_tail = tail.str(),
                        .digest = {} };
}

}  // namespace

std::filesystem::path docker_iidfile_path() {
  static std::atomic_int counter{ 0 };
  auto const name{ "hoist-" + std::to_string(::getpid()) + "-" +
                   std::to_string(counter.fetch_add(1)) + ".iid" };
  return std::filesystem::temp_directory_path() / name;
}

std::vector<std::string> docker_client_argv(std::vector<std::string> const &prefix,
                                            session const &s) {
  if (!s.engine_config || s.engine_config->path().empty()) {
    throw std::logic_error("docker: session for " + s.server + " has no engine config");
  }
  std::vector<std::string> argv{ prefix };
  argv.insert(argv.end(), { "--config", s.engine_config->path().string() });
  return argv;
}

std::vector<std::string> docker_build_argv(std::vector<std::string> const &prefix,
                                           build_request const &request,
                                           std::string const &iidfile) {
  std::vector<std::string> argv{ prefix };
  argv.insert(argv.end(), { "buildx", "build" });

  std::string platforms;
  for (auto const &p : request.platforms) {
    if (!platforms.empty()) { platforms.push_back(','); }
    platforms.append(p);
  }
  argv.insert(argv.end(), { "--platform", platforms });

  for (auto const &[key, value] : request.build_args) {  // std::map: sorted, stable argv
    argv.insert(argv.end(), { "--build-arg", key + "=" + value });
  }

  argv.insert(argv.end(),
              { "--file",
                request.dockerfile.string(),
                "--tag",
                request.local_tag,
                "--iidfile",
                iidfile,
                "--load",
                request.context.string() });
  return argv;
}

std::optional<std::string> docker_parse_push_digest(std::string_view line) {
  constexpr std::string_view kMarker{ "digest: " };
  auto const pos{ line.find(kMarker) };
  if (pos == std::string_view::npos) { return std::nullopt; }

  auto rest{ line.substr(pos + kMarker.size()) };
  rest = rest.substr(0, rest.find(' '));
  if (!sha256_is_digest(rest)) { return std::nullopt; }
  return std::string{ rest };
}

docker_engine::docker_engine(std::vector<std::string> prefix) : prefix_{ std::move(prefix) } {
  if (prefix_.empty()) { throw std::invalid_argument("docker_engine: empty argv prefix"); }
}

engine_result docker_engine::build(build_request const &request, call_limits const &call) {
  auto const iidfile{ docker_iidfile_path() };
  scoped_path_cleanup const cleanup{ iidfile };

  auto result{ run_engine(run_request{ .subject = request.variant,
                                       .argv = docker_build_argv(prefix_,
                                                                 request,
                                                                 iidfile.string()),
                                       .stdin_data = std::nullopt,
                                       .on_line = {} },
                          call) };
  if (!result.ok()) { return result; }

  std::vector<unsigned char> content;
  try {
    content = util_load_file(iidfile);
  } catch (std::runtime_error const &e) {
    result.exit_code = 1;
    result.stderr_tail = std::string{ "engine wrote no image id: " } + e.what();
    return result;
  }

  auto const digest{ util_trim(
      std::string_view{ reinterpret_cast<char const *>(content.data()), content.size() }) };
  if (!sha256_is_digest(digest)) {
    result.exit_code = 1;
    result.stderr_tail = "engine wrote malformed image id '" + std::string{ digest } + "'";
    return result;
  }

  result.digest = std::string{ digest };
  return result;
}

engine_result docker_engine::tag(session const &s,
                                 std::string const &source,
                                 std::string const &target,
                                 call_limits const &call) {
  auto argv{ docker_client_argv(prefix_, s) };
  argv.insert(argv.end(), { "tag", source, target });
  return run_engine(run_request{ .subject = target,
                                 .argv = std::move(argv),
                                 .stdin_data = std::nullopt,
                                 .on_line = {} },
                    call);
}

engine_result docker_engine::push(session const &s,
                                  std::string const &target,
                                  call_limits const &call) {
  auto argv{ docker_client_argv(prefix_, s) };
  argv.insert(argv.end(), { "push", target });

  std::string digest;
  auto result{ run_engine(run_request{ .subject = target,
                                       .argv = std::move(argv),
                                       .stdin_data = std::nullopt,
                                       .on_line =
                                           [&](std::string_view line) {
                                             if (auto d{ docker_parse_push_digest(line) }) {
                                               digest = std::move(*d);
                                             }
                                           } },
                          call) };
  result.digest = std::move(digest);
  return result;
}

engine_result docker_engine::login(registry_credential const &credential,
                                   session const &s,
                                   call_limits const &call) {
  auto argv{ docker_client_argv(prefix_, s) };
  argv.insert(argv.end(),
              { "login", credential.server, "--username", credential.username,
                "--password-stdin" });

  secret const payload{ std::string{ credential.token.reveal() } + "\n" };
  return run_engine(run_request{ .subject = credential.server,
                                 .argv = std::move(argv),
                                 .stdin_data = payload.reveal(),
                                 .on_line = {} },
                    call);
}

}  // namespace hoist
