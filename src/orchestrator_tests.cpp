#include "orchestrator.h"

#include "credentials.h"
#include "test_fakes.h"
#include "tui.h"

#include <doctest/doctest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace {

using hoist::error_kind;
using hoist::exit_status;
using hoist::publish_stage;
using hoist::publish_state;
using hoist::test::fake_digest;

constexpr char const *kDebugRef{ "ghcr.io/henn-dt/open-webui:rag-debug" };
constexpr char const *kOllamaRef{ "ghcr.io/henn-dt/open-webui:rag-debug-with-ollama" };

hoist::publish_plan open_webui_plan() {
  return hoist::publish_plan{
    .registry = "ghcr.io",
    .repository = "henn-dt/open-webui",
    .variants = { hoist::image_variant{ .name = "debug",
                                        .build_args = { { "USE_OLLAMA", "false" } },
                                        .platforms = { "linux/amd64", "linux/arm64" } },
                  hoist::image_variant{ .name = "debug-with-ollama",
                                        .build_args = { { "USE_OLLAMA", "true" } },
                                        .platforms = { "linux/amd64", "linux/arm64" } } },
    .tags = hoist::tag_convention{ .base = "rag-debug",
                                   .default_variant = "debug",
                                   .with = { { "debug-with-ollama", "ollama" } } },
    .concurrency = 2,
    .build = hoist::build_settings{ .context = "/work",
                                    .dockerfile = "/work/Dockerfile",
                                    .timeout = std::chrono::seconds{ 30 } },
    .publish = hoist::publisher_settings{ .login_timeout = std::chrono::seconds{ 5 },
                                          .push_timeout = std::chrono::seconds{ 5 },
                                          .retry_attempts = 3,
                                          .retry_backoff = std::chrono::milliseconds{ 1 } },
  };
}

struct orchestrator_fixture {
  hoist::test::fake_world world;
  hoist::test::fake_build_engine engine{ world };
  hoist::test::fake_registry registry{ world };
  hoist::cancellation cancel;
  hoist::orchestrator orch{ engine, registry, cancel };
  hoist::publish_plan plan{ open_webui_plan() };

  hoist::run_summary run() {
    return orch.run(plan, [] { return hoist::test::fake_credential(); });
  }

  ~orchestrator_fixture() { hoist::tui::clear_redactions(); }
};

hoist::variant_report const &report_for(hoist::run_summary const &summary,
                                        std::string const &name) {
  auto const it{ std::ranges::find_if(summary.variants,
                                      [&](auto const &v) { return v.name == name; }) };
  REQUIRE(it != summary.variants.end());
  return *it;
}

std::vector<std::string> references(std::vector<hoist::publish_target> const &targets) {
  std::vector<std::string> out;
  for (auto const &t : targets) { out.push_back(t.reference()); }
  std::ranges::sort(out);
  return out;
}

}  // namespace

TEST_CASE_FIXTURE(orchestrator_fixture, "publishes every variant under its canonical tag") {
  auto const summary{ run() };

  CHECK(summary.all_done());
  CHECK(summary.exit_code() == exit_status::SUCCESS);
  CHECK(references(summary.published()) ==
        std::vector<std::string>{ kDebugRef, kOllamaRef });

  auto const &debug{ report_for(summary, "debug") };
  CHECK(debug.state == publish_state::DONE);
  REQUIRE(debug.results.size() == 1);
  CHECK(debug.results[0].digest() == fake_digest("debug"));

  auto const &ollama{ report_for(summary, "debug-with-ollama") };
  REQUIRE(ollama.results.size() == 1);
  CHECK(ollama.results[0].target().tag == "rag-debug-with-ollama");

  // one shared session for the whole run
  CHECK(registry.authentications == 1);
  CHECK(engine.logins == 1);
  CHECK(engine.builds == 2);
}

TEST_CASE_FIXTURE(orchestrator_fixture, "re-running with the same inputs yields the same result") {
  auto const first{ run() };
  auto const second{ run() };

  REQUIRE(first.all_done());
  REQUIRE(second.all_done());
  CHECK(references(first.published()) == references(second.published()));
  for (size_t i{ 0 }; i < first.variants.size(); ++i) {
    CHECK(first.variants[i].results[0].digest() == second.variants[i].results[0].digest());
  }
  CHECK(world.served.size() == 2);
}

TEST_CASE_FIXTURE(orchestrator_fixture, "missing token fails before any build") {
  auto const summary{ orch.run(plan, [] {
    return hoist::resolve_credentials(
        {},
        "ghcr.io",
        [](std::string_view name) -> std::optional<std::string> {
          if (name == hoist::kEnvUsername) { return "henn-dt"; }
          if (name == hoist::kEnvToken) { return ""; }
          return std::nullopt;
        });
  }) };

  CHECK(engine.builds == 0);
  CHECK(engine.logins == 0);
  CHECK(summary.exit_code() == exit_status::CREDENTIALS);
  for (auto const &v : summary.variants) {
    CHECK(v.state == publish_state::FAILED);
    REQUIRE(v.failure.has_value());
    CHECK(v.failure->stage == publish_stage::CREDENTIALS);
    CHECK(v.failure->kind == error_kind::CREDENTIAL_MISSING);
  }
}

TEST_CASE_FIXTURE(orchestrator_fixture, "unknown variant fails before any network activity") {
  plan.variants.push_back(hoist::image_variant{ .name = "release",
                                                .build_args = {},
                                                .platforms = { "linux/amd64" } });
  bool resolved{ false };
  auto const summary{ orch.run(plan, [&] {
    resolved = true;
    return hoist::test::fake_credential();
  }) };

  CHECK_FALSE(resolved);
  CHECK(registry.authentications == 0);
  CHECK(engine.builds == 0);
  CHECK(summary.exit_code() == exit_status::USAGE);
  CHECK(report_for(summary, "release").failure->kind == error_kind::UNKNOWN_VARIANT);
}

TEST_CASE_FIXTURE(orchestrator_fixture, "login failure fails every variant at login") {
  registry.auth_error = hoist::publish_error::auth_failed("ghcr.io", 401, "denied");
  auto const summary{ run() };

  CHECK(engine.builds == 0);
  CHECK(summary.exit_code() == exit_status::AUTH);
  for (auto const &v : summary.variants) {
    CHECK(v.failure->stage == publish_stage::LOGIN);
  }
}

TEST_CASE_FIXTURE(orchestrator_fixture, "push timeout then success records one result") {
  engine.on_push = [](std::string const &reference, int attempt) {
    if (reference == kOllamaRef && attempt == 1) {
      return hoist::engine_result{ .exit_code = -1, .timed_out = true };
    }
    return hoist::engine_result{};
  };

  auto const summary{ run() };

  CHECK(summary.all_done());
  auto const &ollama{ report_for(summary, "debug-with-ollama") };
  REQUIRE(ollama.results.size() == 1);
  CHECK(ollama.results[0].succeeded());
  CHECK(ollama.results[0].attempts() == 2);
}

TEST_CASE_FIXTURE(orchestrator_fixture, "digest mismatch fails only the affected variant") {
  registry.on_manifest = [](std::string const &reference) -> std::optional<std::string> {
    if (reference == kOllamaRef) { return fake_digest("tampered"); }
    return std::nullopt;
  };

  auto const summary{ run() };

  CHECK(report_for(summary, "debug").state == publish_state::DONE);
  auto const &ollama{ report_for(summary, "debug-with-ollama") };
  CHECK(ollama.state == publish_state::FAILED);
  CHECK(ollama.failure->stage == publish_stage::PUSH);
  CHECK(ollama.failure->kind == error_kind::DIGEST_MISMATCH);
  CHECK(engine.push_attempts(kOllamaRef) == 1);

  CHECK_FALSE(summary.all_done());
  CHECK(summary.exit_code() == exit_status::PUSH);
  CHECK(references(summary.published()) == std::vector<std::string>{ kDebugRef });
}

TEST_CASE_FIXTURE(orchestrator_fixture, "build failure is isolated to its variant") {
  engine.on_build = [](hoist::build_request const &request) {
    if (request.variant == "debug") {
      return hoist::engine_result{ .exit_code = 1, .stderr_tail = "ERROR: failed to solve" };
    }
    return hoist::engine_result{ .digest = fake_digest(request.variant) };
  };

  auto const summary{ run() };

  auto const &debug{ report_for(summary, "debug") };
  CHECK(debug.failure->stage == publish_stage::BUILD);
  CHECK(debug.failure->kind == error_kind::BUILD_FAILED);
  CHECK(debug.results.empty());
  CHECK(report_for(summary, "debug-with-ollama").state == publish_state::DONE);
  CHECK(summary.exit_code() == exit_status::BUILD);
}

TEST_CASE_FIXTURE(orchestrator_fixture, "builds receive the variant platform set and args") {
  std::mutex mutex;
  std::vector<hoist::build_request> seen;
  engine.on_build = [&](hoist::build_request const &request) {
    std::lock_guard lock{ mutex };
    seen.push_back(request);
    return hoist::engine_result{ .digest = fake_digest(request.variant) };
  };

  static_cast<void>(run());

  REQUIRE(seen.size() == 2);
  for (auto const &r : seen) {
    CHECK(r.platforms == std::vector<std::string>{ "linux/amd64", "linux/arm64" });
    CHECK(r.context == "/work");
    CHECK(r.build_args.contains("USE_OLLAMA"));
  }
}

TEST_CASE_FIXTURE(orchestrator_fixture, "cancel mid-push leaves nothing partially published") {
  plan.concurrency = 1;
  engine.on_push = [this](std::string const &reference, int) {
    if (reference == kOllamaRef) {
      cancel.cancel();
      return hoist::engine_result{ .exit_code = -1, .cancelled = true };
    }
    return hoist::engine_result{};
  };

  auto const summary{ run() };

  CHECK(summary.exit_code() == exit_status::CANCELLED);

  auto const published{ references(summary.published()) };
  auto const cancelled{ references(summary.cancelled()) };
  CHECK(std::ranges::find(cancelled, kOllamaRef) != cancelled.end());
  CHECK(std::ranges::find(published, kOllamaRef) == published.end());
  for (auto const &ref : cancelled) {
    CHECK(std::ranges::find(published, ref) == published.end());
  }

  for (auto const &v : summary.variants) {
    if (v.state == publish_state::FAILED) {
      CHECK(v.failure->kind == error_kind::CANCELLED);
    } else {
      CHECK(v.state == publish_state::DONE);
    }
  }
}

TEST_CASE_FIXTURE(orchestrator_fixture, "cancel before start builds nothing") {
  cancel.cancel();
  auto const summary{ run() };

  CHECK(engine.builds == 0);
  CHECK(summary.exit_code() == exit_status::CANCELLED);
  CHECK(references(summary.cancelled()) == std::vector<std::string>{ kDebugRef, kOllamaRef });
  CHECK(summary.published().empty());
}

TEST_CASE_FIXTURE(orchestrator_fixture, "concurrent builds never exceed the concurrency limit") {
  plan.variants.clear();
  plan.tags.with.clear();
  plan.variants.push_back(hoist::image_variant{ .name = "debug",
                                                .build_args = {},
                                                .platforms = { "linux/amd64" } });
  for (auto const *component : { "ollama", "cuda", "pipelines", "searxng", "tika" }) {
    std::string const name{ std::string{ "debug-with-" } + component };
    plan.tags.with[name] = component;
    plan.variants.push_back(
        hoist::image_variant{ .name = name, .build_args = {}, .platforms = { "linux/amd64" } });
  }
  plan.concurrency = 2;
  engine.build_delay = std::chrono::milliseconds{ 20 };

  auto const summary{ run() };

  CHECK(summary.all_done());
  CHECK(engine.builds == 6);
  CHECK(engine.max_builds_in_flight >= 1);
  CHECK(engine.max_builds_in_flight <= 2);
}

TEST_CASE_FIXTURE(orchestrator_fixture, "concurrency of one builds strictly one at a time") {
  plan.concurrency = 1;
  engine.build_delay = std::chrono::milliseconds{ 10 };

  auto const summary{ run() };

  CHECK(summary.all_done());
  CHECK(engine.max_builds_in_flight == 1);
}

TEST_CASE_FIXTURE(orchestrator_fixture, "build timeout is reported as Timeout at build") {
  engine.on_build = [](hoist::build_request const &request) {
    if (request.variant == "debug") {
      return hoist::engine_result{ .exit_code = -1, .timed_out = true };
    }
    return hoist::engine_result{ .digest = fake_digest(request.variant) };
  };

  auto const summary{ run() };

  auto const &debug{ report_for(summary, "debug") };
  CHECK(debug.state == publish_state::FAILED);
  CHECK(debug.failure->stage == publish_stage::BUILD);
  CHECK(debug.failure->kind == error_kind::TIMEOUT);
  CHECK(debug.results.empty());
  CHECK(report_for(summary, "debug-with-ollama").state == publish_state::DONE);
  CHECK(summary.exit_code() == exit_status::TIMEOUT);
  CHECK(references(summary.published()) == std::vector<std::string>{ kOllamaRef });
}

TEST_CASE_FIXTURE(orchestrator_fixture, "login timeout fails every variant before any build") {
  engine.login_result = hoist::engine_result{ .exit_code = -1, .timed_out = true };

  auto const summary{ run() };

  CHECK(engine.builds == 0);
  CHECK(engine.pushes == 0);
  CHECK(summary.exit_code() == exit_status::TIMEOUT);
  for (auto const &v : summary.variants) {
    CHECK(v.state == publish_state::FAILED);
    CHECK(v.failure->stage == publish_stage::LOGIN);
    CHECK(v.failure->kind == error_kind::TIMEOUT);
  }
  CHECK(summary.published().empty());
}

TEST_CASE_FIXTURE(orchestrator_fixture, "engine login state lives only as long as the run") {
  auto const summary{ run() };
  REQUIRE(summary.all_done());

  auto const dirs{ engine.config_dirs() };
  REQUIRE(dirs.size() == 5);  // login, then tag and push for each of two targets
  CHECK(engine.config_dirs_existed());
  for (auto const &d : dirs) {
    CHECK_FALSE(d.empty());
    CHECK(d == dirs.front());
  }
  CHECK_FALSE(std::filesystem::exists(dirs.front()));
}
