#pragma once

#include "cancellation.h"
#include "publish_types.h"

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hoist {

struct build_request {
  std::string variant;
  std::vector<std::string> platforms;
  std::map<std::string, std::string> build_args;
  std::filesystem::path context;
  std::filesystem::path dockerfile;
  std::string local_tag;  // engine-local reference, e.g. hoist-local/debug:<id>
};

// Raw outcome of one engine invocation. Failures are data here; callers map
// them onto publish_error kinds.
struct engine_result {
  int exit_code{ 0 };
  bool timed_out{ false };
  bool cancelled{ false };
  std::string stderr_tail;
  std::string digest;  // build: image digest; push: digest the engine reported

  bool ok() const { return exit_code == 0 && !timed_out && !cancelled; }
};

// External container build engine (docker buildx and compatible CLIs)
class build_engine {
 public:
  virtual ~build_engine() = default;

  virtual engine_result build(build_request const &request, call_limits const &call) = 0;

  // tag, push and login run with the session's engine config directory
  virtual engine_result tag(session const &s,
                            std::string const &source,
                            std::string const &target,
                            call_limits const &call) = 0;
  virtual engine_result push(session const &s,
                             std::string const &target,
                             call_limits const &call) = 0;

  // Token is delivered on stdin only
  virtual engine_result login(registry_credential const &credential,
                              session const &s,
                              call_limits const &call) = 0;
};

}  // namespace hoist
