#include "build_invoker.h"

#include "sha256.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <cctype>
#include <utility>

namespace hoist {

std::string build_local_reference(std::string_view variant_name) {
  std::string name;
  for (char const c : variant_name) {
    auto const uc{ static_cast<unsigned char>(c) };
    name.push_back(std::isalnum(uc) ? static_cast<char>(std::tolower(uc)) : '-');
  }
  auto const first{ name.find_first_not_of('-') };
  name = first == std::string::npos
             ? std::string{ "variant" }
             : name.substr(first, name.find_last_not_of('-') - first + 1);

  // Folded names collide ("Debug", "debug"); the tag keys on the exact name
  auto const hash{ sha256(variant_name) };
  return "hoist-local/" + name + ":" + util_bytes_to_hex(hash.data(), 8);
}

build_invoker::build_invoker(build_engine &engine, build_settings settings)
    : engine_{ engine }, settings_{ std::move(settings) } {}

build_outcome build_invoker::build(image_variant const &variant,
                                   cancellation const &cancel) {
  stage_trace_scope trace{ variant.name, publish_stage::BUILD };

  build_request const request{ .variant = variant.name,
                               .platforms = variant.platforms,
                               .build_args = variant.build_args,
                               .context = settings_.context,
                               .dockerfile = settings_.dockerfile,
                               .local_tag = build_local_reference(variant.name) };

  tui::info("Building %s for %zu platform(s)", variant.name.c_str(), variant.platforms.size());

  auto const result{ engine_.build(
      request,
      call_limits{ .deadline = std::chrono::steady_clock::now() + settings_.timeout,
                   .cancel = &cancel }) };

  if (result.cancelled) { throw publish_error::cancelled(publish_stage::BUILD, variant.name); }
  if (result.timed_out) { throw publish_error::timeout(publish_stage::BUILD, variant.name); }
  if (!result.ok()) {
    throw publish_error::build_failed(variant.name, result.exit_code, result.stderr_tail);
  }

  tui::info("Built %s: %s", variant.name.c_str(), result.digest.c_str());
  trace.succeed();
  return build_outcome{ .local_image = request.local_tag, .digest = result.digest };
}

}  // namespace hoist
