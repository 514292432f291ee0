#pragma once

#include "build_engine.h"
#include "cancellation.h"
#include "publish_types.h"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace hoist {

struct build_settings {
  std::filesystem::path context;
  std::filesystem::path dockerfile;
  std::chrono::seconds timeout{ 3600 };
};

class build_invoker {
 public:
  build_invoker(build_engine &engine, build_settings settings);

  // One engine build for the variant's whole platform set. Throws BuildFailed,
  // Timeout(build) or Cancelled(build). Never retries.
  build_outcome build(image_variant const &variant, cancellation const &cancel);

 private:
  build_engine &engine_;
  build_settings settings_;
};

// Engine-local reference for a variant's build output:
// hoist-local/<folded name>:<16 hex of sha256(name)>. Distinct names never share one.
std::string build_local_reference(std::string_view variant_name);

}  // namespace hoist
