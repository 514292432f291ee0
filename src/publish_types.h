#pragma once

#include "publish_error.h"
#include "publish_stage.h"
#include "secret.h"
#include "util.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hoist {

struct image_variant {
  std::string name;
  std::map<std::string, std::string> build_args;
  std::vector<std::string> platforms;  // ordered, no duplicates
};

struct registry_credential {
  std::string server;
  std::string username;
  secret token;
  std::string email;
};

struct publish_target {
  std::string registry;
  std::string repository;
  std::string tag;

  std::string reference() const;  // registry/repository:tag

  bool operator==(publish_target const &) const = default;
};

// Output of one successful build: engine-local image id plus its digest.
struct build_outcome {
  std::string local_image;
  std::string digest;  // sha256:...
};

// Authenticated registry session. Produced once by login and passed to every push.
struct session {
  std::string server;
  std::string repository;
  std::string username;
  secret authorization;  // "Bearer ..." or "Basic ..." header value; empty if anonymous

  // Private engine client config directory (docker --config) holding the
  // engine login for this session only. Removed when the last copy of the
  // session is destroyed.
  std::shared_ptr<scoped_path_cleanup const> engine_config;
};

// Outcome of pushing one target, after retries. Immutable once created.
class publish_result {
 public:
  static publish_result success(publish_target target, std::string digest, int attempts);
  static publish_result failure(publish_target target,
                                error_kind kind,
                                std::string message,
                                int attempts,
                                std::string digest = {});

  publish_target const &target() const { return target_; }
  std::string const &digest() const { return digest_; }
  bool succeeded() const { return succeeded_; }
  std::optional<error_kind> error() const { return error_; }
  std::string const &error_message() const { return error_message_; }
  int attempts() const { return attempts_; }

 private:
  publish_result(publish_target target,
                 std::string digest,
                 bool succeeded,
                 std::optional<error_kind> error,
                 std::string error_message,
                 int attempts);

  publish_target target_;
  std::string digest_;
  bool succeeded_;
  std::optional<error_kind> error_;
  std::string error_message_;
  int attempts_;
};

// Pull-secret plus deployment reference, handed to an external cluster client.
struct deployment_patch {
  std::string secret_name;
  std::string namespace_name;
  std::optional<publish_target> image;
  std::string server;
  secret docker_config_json;  // kubernetes.io/dockerconfigjson payload (unencoded)

  // Deployment being patched; filled in from the manifest DEPLOYMENT table
  std::string deployment_name;
  std::string container_name;
};

struct variant_failure {
  publish_stage stage;
  error_kind kind;
  std::string message;
};

struct variant_report {
  std::string name;
  std::vector<std::string> platforms;
  publish_state state{ publish_state::IDLE };
  std::optional<variant_failure> failure;
  std::optional<build_outcome> build;
  std::vector<publish_target> targets;
  std::vector<publish_result> results;
  std::vector<publish_target> cancelled;  // targets whose push was aborted or never began
};

struct run_summary {
  std::vector<variant_report> variants;  // manifest order

  bool all_done() const;
  std::vector<publish_target> published() const;
  // First successfully pushed target of `variant`, if any
  std::optional<publish_target> published_target(std::string_view variant) const;
  std::vector<publish_target> cancelled() const;

  // Failure chosen for the exit code: cancellation first, then the earliest
  // stage, then manifest order.
  std::optional<variant_failure> decisive_failure() const;
  exit_status exit_code() const;
};

std::string summary_to_json(run_summary const &summary);
std::string summary_variant_line(variant_report const &report);

}  // namespace hoist
