#pragma once

#include "publish_types.h"
#include "tag_resolver.h"
#include "util.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hoist {

struct deployment_cfg {
  std::string name;
  std::string namespace_name;
  std::string container;
  std::string secret_name;
};

// Settings read from hoist.lua. Validation failures throw ConfigInvalid.
struct manifest : unmovable {
  std::filesystem::path manifest_path;

  std::string registry;
  std::string repository;
  std::vector<std::string> platforms;
  std::vector<image_variant> variants;
  tag_convention tags;

  int concurrency{ 2 };
  std::chrono::seconds push_timeout{ 600 };
  std::chrono::seconds build_timeout{ 3600 };
  std::chrono::seconds login_timeout{ 60 };
  int retry_attempts{ 3 };
  std::chrono::milliseconds retry_backoff{ 1000 };

  std::filesystem::path context;     // absolute
  std::filesystem::path dockerfile;  // absolute
  std::vector<std::string> engine{ "docker" };

  std::optional<deployment_cfg> deployment;

  manifest() = default;

  // Use explicit path if given, otherwise discover from the current directory.
  // Returns an absolute path or throws ConfigInvalid.
  static std::filesystem::path find_manifest_path(
      std::optional<std::filesystem::path> const &explicit_path);

  // Walk up looking for hoist.lua; stops at a directory containing .git
  static std::optional<std::filesystem::path> discover();

  static std::unique_ptr<manifest> load(std::filesystem::path const &manifest_path);
  static std::unique_ptr<manifest> load(char const *script,
                                        std::filesystem::path const &manifest_path);

  // Variants named in `names`, in manifest order; all variants when `names` is
  // empty. Throws UnknownVariant for a name that is not configured.
  std::vector<image_variant> select_variants(std::vector<std::string> const &names) const;
};

// os/arch[/variant], each part lowercase alphanumeric or '_'
bool platform_is_valid(std::string_view platform);

}  // namespace hoist
