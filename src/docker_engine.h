#pragma once

#include "build_engine.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hoist {

class docker_engine : public build_engine {
 public:
  // `prefix` is the engine argv prefix, e.g. {"docker"} or {"sudo", "docker"}
  explicit docker_engine(std::vector<std::string> prefix);

  engine_result build(build_request const &request, call_limits const &call) override;
  engine_result tag(session const &s,
                    std::string const &source,
                    std::string const &target,
                    call_limits const &call) override;
  engine_result push(session const &s,
                     std::string const &target,
                     call_limits const &call) override;
  engine_result login(registry_credential const &credential,
                      session const &s,
                      call_limits const &call) override;

 private:
  std::vector<std::string> prefix_;
};

// Unique image id file in the temp directory; independent of the variant name
std::filesystem::path docker_iidfile_path();

// `prefix` plus `--config <dir>` for the session's engine config. Throws
// std::logic_error if the session has none.
std::vector<std::string> docker_client_argv(std::vector<std::string> const &prefix,
                                            session const &s);

// buildx argv for `request`, writing the image id to `iidfile`
std::vector<std::string> docker_build_argv(std::vector<std::string> const &prefix,
                                           build_request const &request,
                                           std::string const &iidfile);

// Digest from a `docker push` output line such as
// "debug: digest: sha256:abc... size: 1234"
std::optional<std::string> docker_parse_push_digest(std::string_view line);

}  // namespace hoist
