#include "tui.h"

#include <doctest/doctest.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

TEST_CASE("tui init can only run once") {
  CHECK_THROWS_AS(hoist::tui::init(), std::logic_error);
}

TEST_CASE("tui enforces run/shutdown sequencing") {
  auto const handler{ [](std::string_view) {} };
  CHECK_NOTHROW(hoist::tui::set_output_handler(handler));
  CHECK_NOTHROW(hoist::tui::run(hoist::tui::level::TUI_INFO));
  CHECK_NOTHROW(hoist::tui::shutdown());

  CHECK_NOTHROW(hoist::tui::run(std::nullopt));
  CHECK_THROWS_AS(hoist::tui::set_output_handler(handler), std::logic_error);
  CHECK_THROWS_AS(hoist::tui::run(std::nullopt), std::logic_error);

  CHECK_NOTHROW(hoist::tui::shutdown());
  CHECK_THROWS_AS(hoist::tui::shutdown(), std::logic_error);

  CHECK_NOTHROW(hoist::tui::set_output_handler(handler));
}

namespace {

struct captured_output {
  std::vector<std::string> messages;

  captured_output() {
    hoist::tui::set_output_handler(
        [this](std::string_view value) { messages.emplace_back(value); });
  }

  ~captured_output() {
    try {
      hoist::tui::set_output_handler([](std::string_view) {});
    } catch (std::logic_error const &error) {
      FAIL("set_output_handler should not throw during teardown: " << error.what());
    }
    hoist::tui::clear_redactions();
  }
};

}  // namespace

TEST_CASE_FIXTURE(captured_output, "tui unstructured logs are raw messages") {
  CHECK_NOTHROW(hoist::tui::run(std::nullopt));

  hoist::tui::debug("hello %s", "world");
  hoist::tui::info("value %d", 42);
  hoist::tui::error("boom");

  CHECK_NOTHROW(hoist::tui::shutdown());

  REQUIRE(messages.size() == 3);
  CHECK(messages[0] == "hello world\n");
  CHECK(messages[1] == "value 42\n");
  CHECK(messages[2] == "boom\n");
}

TEST_CASE_FIXTURE(captured_output, "tui structured logs include prefix") {
  CHECK_NOTHROW(hoist::tui::run(hoist::tui::level::TUI_DEBUG, true));
  hoist::tui::info("structured %d", 7);
  CHECK_NOTHROW(hoist::tui::shutdown());

  REQUIRE(messages.size() == 1);
  auto const &line{ messages[0] };
  CHECK(line.find("[INF") != std::string::npos);
  CHECK(line.rfind("structured 7\n") == line.size() - std::string("structured 7\n").size());
}

TEST_CASE_FIXTURE(captured_output, "tui severity filtering honors threshold") {
  CHECK_NOTHROW(hoist::tui::run(hoist::tui::level::TUI_WARN, true));
  hoist::tui::debug("debug");
  hoist::tui::info("info");
  hoist::tui::warn("warn");
  hoist::tui::error("error");
  CHECK_NOTHROW(hoist::tui::shutdown());

  REQUIRE(messages.size() == 2);
  CHECK(messages[0].find("WRN") != std::string::npos);
  CHECK(messages[1].find("ERR") != std::string::npos);
}

TEST_CASE_FIXTURE(captured_output, "tui masks registered secrets in log lines") {
  hoist::tui::redact("ghp_supersecret");
  CHECK_NOTHROW(hoist::tui::run(std::nullopt));
  hoist::tui::error("login failed with token ghp_supersecret and again ghp_supersecret");
  CHECK_NOTHROW(hoist::tui::shutdown());

  REQUIRE(messages.size() == 1);
  CHECK(messages[0] == "login failed with token *** and again ***\n");
}

TEST_CASE_FIXTURE(captured_output, "tui masks registered secrets in trace output") {
  hoist::tui::redact("Zm9vOmJhcg==");
  hoist::tui::configure_trace_outputs(
      { { hoist::tui::trace_output_type::std_err, std::nullopt } });
  CHECK_NOTHROW(hoist::tui::run(hoist::tui::level::TUI_TRACE, false));

  hoist::tui::trace(hoist::trace_events::process_start{
      .subject = "login",
      .command = "curl -H 'Authorization: Basic Zm9vOmJhcg=='",
  });

  CHECK_NOTHROW(hoist::tui::shutdown());
  hoist::tui::configure_trace_outputs({});

  REQUIRE_FALSE(messages.empty());
  CHECK(messages[0].find("process_start") != std::string::npos);
  CHECK(messages[0].find("Zm9vOmJhcg==") == std::string::npos);
  CHECK(messages[0].find("Basic ***") != std::string::npos);
}

TEST_CASE("apply_redactions ignores short values") {
  hoist::tui::redact("abc");
  CHECK(hoist::tui::apply_redactions("abc abc") == "abc abc");
  hoist::tui::redact("abcd");
  CHECK(hoist::tui::apply_redactions("xabcdx") == "x***x");
  hoist::tui::clear_redactions();
  CHECK(hoist::tui::apply_redactions("abcd") == "abcd");
}
