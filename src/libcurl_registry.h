#pragma once

#include "registry_api.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace hoist {

class libcurl_registry : public registry_api {
 public:
  // `scheme` is "https" except for local test registries
  explicit libcurl_registry(std::string scheme = "https");

  session authenticate(registry_credential const &credential,
                       std::string const &repository,
                       call_limits const &limits) override;
  std::string manifest_digest(session const &s,
                              publish_target const &target,
                              call_limits const &limits) override;

 private:
  std::string scheme_;
};

void libcurl_ensure_initialized();

// WWW-Authenticate header, e.g. Bearer realm="https://ghcr.io/token",service="ghcr.io"
struct auth_challenge {
  std::string scheme;  // "Bearer", "Basic"
  std::map<std::string, std::string> params;
};

std::optional<auth_challenge> registry_parse_challenge(std::string_view header);

// Top-level string field of a flat JSON object ({"token":"..."}); nullopt when absent
std::optional<std::string> registry_json_string_field(std::string_view body,
                                                      std::string_view key);

}  // namespace hoist
