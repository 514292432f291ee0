#pragma once

#include "publish_types.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace hoist {

// Where credentials come from: "env" or "file:<path>"
struct credential_source {
  enum class kind { ENV, FILE };

  kind type{ kind::ENV };
  std::filesystem::path file;

  // Throws ConfigInvalid on anything else
  static credential_source parse(std::string_view spec);
};

using env_lookup_fn = std::function<std::optional<std::string>(std::string_view)>;

// getenv-backed lookup
env_lookup_fn credentials_process_env();

// Environment variables consulted for credential_source::kind::ENV
inline constexpr char const *kEnvServer{ "HOIST_REGISTRY_SERVER" };
inline constexpr char const *kEnvUsername{ "HOIST_REGISTRY_USERNAME" };
inline constexpr char const *kEnvToken{ "HOIST_REGISTRY_TOKEN" };
inline constexpr char const *kEnvEmail{ "HOIST_REGISTRY_EMAIL" };

// Resolve a complete credential, or throw CredentialMissing (server, username or
// token absent or blank) / CredentialInvalid (server not host[:port], unreadable or
// over-permissive secret file). `default_server` fills in a missing server. No
// network access. The token is registered with tui::redact before returning.
registry_credential resolve_credentials(credential_source const &source,
                                        std::string_view default_server,
                                        env_lookup_fn const &env);

// host[:port] with DNS-style labels; no scheme, path or userinfo
bool credentials_server_is_valid(std::string_view server);

}  // namespace hoist
