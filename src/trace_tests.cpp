#include "trace.h"

#include <doctest/doctest.h>

#include <string>
#include <vector>

namespace {

void expect_json_tokens(hoist::trace_event_t const &event, std::vector<std::string> tokens) {
  auto const json{ hoist::trace_event_to_json(event) };
  CHECK_MESSAGE(json.find("\"ts\"") != std::string::npos, "missing timestamp in json");
  CHECK(json.front() == '{');
  CHECK(json.back() == '}');
  tokens.emplace_back(std::string{ "\"event\":\"" } +
                      std::string(hoist::trace_event_name(event)) + "\"");
  for (auto const &token : tokens) {
    CHECK_MESSAGE(json.find(token) != std::string::npos,
                  "missing token: " << token << " in json: " << json);
  }
}

}  // namespace

TEST_CASE("trace_event_to_json serializes publish events") {
  expect_json_tokens(
      hoist::trace_events::stage_start{ .subject = "debug",
                                        .stage = hoist::publish_stage::BUILD },
      { "\"subject\":\"debug\"", "\"stage\":\"build\"" });

  expect_json_tokens(
      hoist::trace_events::stage_complete{ .subject = "ghcr.io/a/b:t",
                                           .stage = hoist::publish_stage::PUSH,
                                           .duration_ms = 1500,
                                           .succeeded = true },
      { "\"duration_ms\":1500", "\"succeeded\":true" });

  expect_json_tokens(hoist::trace_events::push_attempt{ .target = "ghcr.io/a/b:t",
                                                        .attempt = 2,
                                                        .max_attempts = 3 },
                     { "\"attempt\":2", "\"max_attempts\":3" });

  expect_json_tokens(hoist::trace_events::push_backoff{ .target = "ghcr.io/a/b:t",
                                                        .attempt = 1,
                                                        .delay_ms = 1000,
                                                        .reason = "Timeout" },
                     { "\"delay_ms\":1000", "\"reason\":\"Timeout\"" });

  expect_json_tokens(hoist::trace_events::digest_verified{ .target = "ghcr.io/a/b:t",
                                                           .expected = "sha256:aa",
                                                           .actual = "sha256:bb",
                                                           .matched = false },
                     { "\"expected\":\"sha256:aa\"", "\"matched\":false" });

  expect_json_tokens(hoist::trace_events::process_exit{ .subject = "debug",
                                                        .exit_code = 1,
                                                        .duration_ms = 20,
                                                        .timed_out = true,
                                                        .cancelled = false },
                     { "\"exit_code\":1", "\"timed_out\":true" });

  expect_json_tokens(hoist::trace_events::http_request{ .method = "GET",
                                                        .url = "https://ghcr.io/v2/",
                                                        .status = 401,
                                                        .duration_ms = 5 },
                     { "\"method\":\"GET\"", "\"status\":401" });

  expect_json_tokens(hoist::trace_events::cancel_requested{ .source = "SIGINT" },
                     { "\"source\":\"SIGINT\"" });
}

TEST_CASE("trace_event_to_json escapes special characters") {
  auto const json{ hoist::trace_event_to_json(
      hoist::trace_events::process_start{ .subject = "q\"uote",
                                          .command = "line1\nline2" }) };
  CHECK(json.find("q\\\"uote") != std::string::npos);
  CHECK(json.find("line1\\nline2") != std::string::npos);
}

TEST_CASE("trace_event_to_string is human readable") {
  auto const text{ hoist::trace_event_to_string(
      hoist::trace_events::push_attempt{ .target = "r:t", .attempt = 1, .max_attempts = 3 }) };
  CHECK(text == "push_attempt target=r:t attempt=1/3");
}
