#pragma once

#include "build_engine.h"
#include "cancellation.h"
#include "publish_types.h"
#include "registry_api.h"
#include "util.h"

#include <tbb/concurrent_hash_map.h>

#include <chrono>
#include <string>

namespace hoist {

struct publisher_settings {
  std::chrono::seconds login_timeout{ 60 };
  std::chrono::seconds push_timeout{ 600 };
  int retry_attempts{ 3 };
  std::chrono::milliseconds retry_backoff{ 1000 };
};

class registry_publisher : unmovable {
 public:
  registry_publisher(build_engine &engine, registry_api &api, publisher_settings settings);

  // Registry API handshake, then engine login into a private engine config
  // directory owned by the returned session. Throws AuthFailed or
  // Timeout/Cancelled at LOGIN. Never retried.
  session login(registry_credential const &credential,
                std::string const &repository,
                cancellation const &cancel);

  // Tag, push and verify one target. PushFailed and push timeouts are retried
  // with exponential backoff up to retry_attempts; the returned result is the
  // final one. Throws Cancelled(push) if the run is aborted. At most one push
  // per target reference is in flight.
  publish_result push(session const &s,
                      build_outcome const &local,
                      publish_target const &target,
                      cancellation const &cancel);

 private:
  std::string attempt(session const &s,
                      build_outcome const &local,
                      publish_target const &target,
                      cancellation const &cancel);

  build_engine &engine_;
  registry_api &api_;
  publisher_settings settings_;

  // Holding an accessor on a reference serializes pushes to that reference
  tbb::concurrent_hash_map<std::string, int> in_flight_;
};

}  // namespace hoist
