#pragma once

#include "build_engine.h"
#include "build_invoker.h"
#include "cancellation.h"
#include "manifest.h"
#include "publish_types.h"
#include "registry_api.h"
#include "registry_publisher.h"
#include "tag_resolver.h"
#include "util.h"

#include <functional>
#include <string>
#include <vector>

namespace hoist {

// Everything one publish run needs, detached from the Lua manifest
struct publish_plan {
  std::string registry;
  std::string repository;
  std::vector<image_variant> variants;  // manifest order
  tag_convention tags;
  int concurrency{ 2 };
  build_settings build;
  publisher_settings publish;
};

// Throws UnknownVariant for a name the manifest does not configure
publish_plan make_publish_plan(manifest const &m, std::vector<std::string> const &names);

using credential_resolver = std::function<registry_credential()>;

// Drives every variant through login -> build -> tag -> push -> finalize.
// Failures are captured per variant in the returned summary; nothing escapes
// except programming errors.
class orchestrator : unmovable {
 public:
  orchestrator(build_engine &engine, registry_api &api, cancellation &cancel);

  run_summary run(publish_plan const &plan, credential_resolver const &resolve);

 private:
  build_engine &engine_;
  registry_api &api_;
  cancellation &cancel_;
};

}  // namespace hoist
