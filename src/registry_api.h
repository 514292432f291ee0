#pragma once

#include "cancellation.h"
#include "publish_types.h"

#include <string>

namespace hoist {

// Registry HTTP API (OCI distribution spec) as seen by the publisher
class registry_api {
 public:
  virtual ~registry_api() = default;

  // Ping /v2/ and complete whatever challenge it answers with, scoped to
  // pull,push on `repository`. Throws AuthFailed, or Timeout/Cancelled at LOGIN.
  virtual session authenticate(registry_credential const &credential,
                               std::string const &repository,
                               call_limits const &limits) = 0;

  // Digest of the manifest the registry now serves for `target`. Throws
  // PushFailed (transient), DigestMismatch if the registry's digest header
  // disagrees with the body, or Timeout/Cancelled at PUSH.
  virtual std::string manifest_digest(session const &s,
                                      publish_target const &target,
                                      call_limits const &limits) = 0;
};

}  // namespace hoist
