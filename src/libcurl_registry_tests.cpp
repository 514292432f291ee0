#include "libcurl_registry.h"

#include <doctest/doctest.h>

TEST_CASE("registry_parse_challenge reads a ghcr Bearer challenge") {
  auto const c{ hoist::registry_parse_challenge(
      R"(Bearer realm="https://ghcr.io/token",service="ghcr.io",scope="repository:henn-dt/open-webui:pull")") };
  REQUIRE(c.has_value());
  CHECK(c->scheme == "Bearer");
  CHECK(c->params.at("realm") == "https://ghcr.io/token");
  CHECK(c->params.at("service") == "ghcr.io");
  CHECK(c->params.at("scope") == "repository:henn-dt/open-webui:pull");
}

TEST_CASE("registry_parse_challenge handles Basic and unquoted params") {
  auto const basic{ hoist::registry_parse_challenge("Basic realm=\"Registry\"") };
  REQUIRE(basic.has_value());
  CHECK(basic->scheme == "Basic");
  CHECK(basic->params.at("realm") == "Registry");

  auto const bare{ hoist::registry_parse_challenge("Bearer Realm=https://r/token , service=r") };
  REQUIRE(bare.has_value());
  CHECK(bare->params.at("realm") == "https://r/token");
  CHECK(bare->params.at("service") == "r");

  auto const scheme_only{ hoist::registry_parse_challenge("Basic") };
  REQUIRE(scheme_only.has_value());
  CHECK(scheme_only->params.empty());
}

TEST_CASE("registry_parse_challenge rejects an empty header") {
  CHECK_FALSE(hoist::registry_parse_challenge("").has_value());
  CHECK_FALSE(hoist::registry_parse_challenge("   ").has_value());
}

TEST_CASE("registry_json_string_field finds top-level strings") {
  auto const body{ R"({"token": "abc\"def", "expires_in": 300, "access_token":"xyz"})" };
  CHECK(hoist::registry_json_string_field(body, "token") == "abc\"def");
  CHECK(hoist::registry_json_string_field(body, "access_token") == "xyz");
  CHECK_FALSE(hoist::registry_json_string_field(body, "expires_in").has_value());
  CHECK_FALSE(hoist::registry_json_string_field(body, "refresh_token").has_value());
  CHECK_FALSE(hoist::registry_json_string_field(R"({"token":"unterminated)", "token")
                  .has_value());
}
