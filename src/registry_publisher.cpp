#include "registry_publisher.h"

#include "sha256.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <utility>

namespace hoist {

namespace {

call_limits limits_for(std::chrono::seconds timeout, cancellation const &cancel) {
  return call_limits{ .deadline = std::chrono::steady_clock::now() + timeout,
                      .cancel = &cancel };
}

std::string first_line(std::string_view text) {
  return std::string{ util_trim(text.substr(0, text.find('\n'))) };
}

}  // namespace

registry_publisher::registry_publisher(build_engine &engine,
                                       registry_api &api,
                                       publisher_settings settings)
    : engine_{ engine }, api_{ api }, settings_{ std::move(settings) } {}

session registry_publisher::login(registry_credential const &credential,
                                  std::string const &repository,
                                  cancellation const &cancel) {
  stage_trace_scope trace{ credential.server, publish_stage::LOGIN };
  auto const limits{ limits_for(settings_.login_timeout, cancel) };

  tui::info("Logging in to %s as %s", credential.server.c_str(), credential.username.c_str());
  auto s{ api_.authenticate(credential, repository, limits) };
  s.engine_config = std::make_shared<scoped_path_cleanup const>(
      util_make_private_temp_dir("hoist-session-"));

  auto const result{ engine_.login(credential, s, limits) };
  if (result.cancelled) {
    throw publish_error::cancelled(publish_stage::LOGIN, credential.server);
  }
  if (result.timed_out) { throw publish_error::timeout(publish_stage::LOGIN, credential.server); }
  if (!result.ok()) {
    throw publish_error::auth_failed(credential.server,
                                     0,
                                     "engine login exited with code " +
                                         std::to_string(result.exit_code) + ": " +
                                         first_line(result.stderr_tail));
  }

  trace.succeed();
  return s;
}

std::string registry_publisher::attempt(session const &s,
                                        build_outcome const &local,
                                        publish_target const &target,
                                        cancellation const &cancel) {
  auto const reference{ target.reference() };
  auto const limits{ limits_for(settings_.push_timeout, cancel) };

  auto const check{ [&](engine_result const &r, std::string_view what) {
    if (r.cancelled) { throw publish_error::cancelled(publish_stage::PUSH, reference); }
    if (r.timed_out) { throw publish_error::timeout(publish_stage::PUSH, reference); }
    if (!r.ok()) {
      throw publish_error::push_failed(reference,
                                       std::string{ what } + " exited with code " +
                                           std::to_string(r.exit_code) + ": " +
                                           first_line(r.stderr_tail));
    }
  } };

  check(engine_.tag(s, local.local_image, reference, limits), "tag");

  auto const pushed{ engine_.push(s, reference, limits) };
  check(pushed, "push");

  auto const actual{ api_.manifest_digest(s, target, limits) };
  bool const matched{ sha256_digest_equal(local.digest, actual) };
  HOIST_TRACE_DIGEST_VERIFIED(reference, local.digest, actual, matched);
  if (!matched) { throw publish_error::digest_mismatch(reference, local.digest, actual); }

  if (!pushed.digest.empty() && !sha256_digest_equal(pushed.digest, actual)) {
    tui::warn("%s: engine reported %s, registry serves %s",
              reference.c_str(),
              pushed.digest.c_str(),
              actual.c_str());
  }
  return actual;
}

publish_result registry_publisher::push(session const &s,
                                        build_outcome const &local,
                                        publish_target const &target,
                                        cancellation const &cancel) {
  auto const reference{ target.reference() };

  decltype(in_flight_)::accessor slot;
  in_flight_.insert(slot, reference);
  ++slot->second;

  stage_trace_scope trace{ reference, publish_stage::PUSH };
  int const max_attempts{ std::max(1, settings_.retry_attempts) };
  auto delay{ settings_.retry_backoff };

  for (int n{ 1 };; ++n) {
    if (cancel.requested()) { throw publish_error::cancelled(publish_stage::PUSH, reference); }
    HOIST_TRACE_PUSH_ATTEMPT(reference, n, max_attempts);
    tui::info("Pushing %s (attempt %d/%d)", reference.c_str(), n, max_attempts);

    try {
      auto digest{ attempt(s, local, target, cancel) };
      tui::info("Published %s@%s", reference.c_str(), digest.c_str());
      trace.succeed();
      return publish_result::success(target, std::move(digest), n);
    } catch (publish_error const &e) {
      if (e.kind() == error_kind::CANCELLED) { throw; }

      if (!error_kind_is_transient(e.kind()) || n >= max_attempts) {
        tui::error("%s", e.what());
        return publish_result::failure(target,
                                       e.kind(),
                                       e.what(),
                                       n,
                                       e.info().actual_digest);
      }

      tui::warn("%s; retrying in %lld ms", e.what(), static_cast<long long>(delay.count()));
      HOIST_TRACE_PUSH_BACKOFF(reference,
                               n,
                               static_cast<std::int64_t>(delay.count()),
                               std::string{ error_kind_name(e.kind()) });
    }

    if (!cancel.sleep_for(delay)) {
      throw publish_error::cancelled(publish_stage::PUSH, reference);
    }
    delay *= 2;
  }
}

}  // namespace hoist
