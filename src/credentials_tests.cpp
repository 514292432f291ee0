#include "credentials.h"

#include "tui.h"

#include <doctest/doctest.h>

#include <sys/stat.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>

namespace {

hoist::env_lookup_fn fake_env(std::map<std::string, std::string> values) {
  return [values = std::move(values)](std::string_view name) -> std::optional<std::string> {
    if (auto const it{ values.find(std::string{ name }) }; it != values.end()) {
      return it->second;
    }
    return std::nullopt;
  };
}

std::filesystem::path write_secret_file(std::string const &content, mode_t mode) {
  static std::atomic<int> counter{ 0 };
  auto const path{ std::filesystem::temp_directory_path() /
                   ("hoist-cred-test-" + std::to_string(counter.fetch_add(1))) };
  {
    std::ofstream out{ path };
    out << content;
  }
  ::chmod(path.c_str(), mode);
  return path;
}

hoist::error_kind kind_of(auto &&fn) {
  try {
    fn();
  } catch (hoist::publish_error const &e) { return e.kind(); }
  FAIL("expected publish_error");
  return hoist::error_kind::CONFIG_INVALID;
}

}  // namespace

TEST_CASE("credential_source::parse") {
  CHECK(hoist::credential_source::parse("env").type == hoist::credential_source::kind::ENV);
  auto const file{ hoist::credential_source::parse("file:/run/secrets/ghcr") };
  CHECK(file.type == hoist::credential_source::kind::FILE);
  CHECK(file.file == "/run/secrets/ghcr");
  CHECK(kind_of([] { hoist::credential_source::parse("vault:x"); }) ==
        hoist::error_kind::CONFIG_INVALID);
  CHECK(kind_of([] { hoist::credential_source::parse("file:"); }) ==
        hoist::error_kind::CONFIG_INVALID);
}

TEST_CASE("resolve_credentials from environment") {
  auto const cred{ hoist::resolve_credentials(
      {},
      "ghcr.io",
      fake_env({ { hoist::kEnvUsername, "henn-dt" },
                 { hoist::kEnvToken, "ghp_0123456789abcdef" },
                 { hoist::kEnvEmail, "ops@example.com" } })) };

  CHECK(cred.server == "ghcr.io");
  CHECK(cred.username == "henn-dt");
  CHECK(cred.token.reveal() == "ghp_0123456789abcdef");
  CHECK(cred.email == "ops@example.com");
  CHECK(hoist::tui::apply_redactions("t=ghp_0123456789abcdef") == "t=***");
  hoist::tui::clear_redactions();
}

TEST_CASE("resolve_credentials prefers explicit server over manifest registry") {
  auto const cred{ hoist::resolve_credentials({},
                                              "ghcr.io",
                                              fake_env({ { hoist::kEnvServer, "registry.local:5000" },
                                                         { hoist::kEnvUsername, "u" },
                                                         { hoist::kEnvToken, "tok-1234" } })) };
  CHECK(cred.server == "registry.local:5000");
  CHECK(cred.email.empty());
  hoist::tui::clear_redactions();
}

TEST_CASE("resolve_credentials rejects missing or blank fields") {
  SUBCASE("empty token") {
    CHECK(kind_of([] {
            hoist::resolve_credentials({},
                                       "ghcr.io",
                                       fake_env({ { hoist::kEnvUsername, "u" },
                                                  { hoist::kEnvToken, "" } }));
          }) == hoist::error_kind::CREDENTIAL_MISSING);
  }

  SUBCASE("whitespace username") {
    CHECK(kind_of([] {
            hoist::resolve_credentials({},
                                       "ghcr.io",
                                       fake_env({ { hoist::kEnvUsername, "  " },
                                                  { hoist::kEnvToken, "tok-1234" } }));
          }) == hoist::error_kind::CREDENTIAL_MISSING);
  }

  SUBCASE("no server anywhere") {
    CHECK(kind_of([] {
            hoist::resolve_credentials({},
                                       "",
                                       fake_env({ { hoist::kEnvUsername, "u" },
                                                  { hoist::kEnvToken, "tok-1234" } }));
          }) == hoist::error_kind::CREDENTIAL_MISSING);
  }
}

TEST_CASE("resolve_credentials error text never contains the token") {
  try {
    hoist::resolve_credentials({},
                               "https://ghcr.io/",
                               fake_env({ { hoist::kEnvUsername, "u" },
                                          { hoist::kEnvToken, "ghp_do_not_print" } }));
    FAIL("expected CredentialInvalid");
  } catch (hoist::publish_error const &e) {
    CHECK(e.kind() == hoist::error_kind::CREDENTIAL_INVALID);
    CHECK(std::string{ e.what() }.find("ghp_do_not_print") == std::string::npos);
  }
}

TEST_CASE("resolve_credentials from secret file") {
  auto const path{ write_secret_file(
      "# registry login\nserver = ghcr.io\nusername=henn-dt\ntoken=ghp_file_token\n",
      0600) };

  auto const cred{ hoist::resolve_credentials(
      hoist::credential_source{ .type = hoist::credential_source::kind::FILE, .file = path },
      "",
      fake_env({})) };
  CHECK(cred.server == "ghcr.io");
  CHECK(cred.username == "henn-dt");
  CHECK(cred.token.reveal() == "ghp_file_token");

  std::filesystem::remove(path);
  hoist::tui::clear_redactions();
}

TEST_CASE("resolve_credentials refuses group-readable secret file") {
  auto const path{ write_secret_file("username=u\ntoken=t0k3n\n", 0640) };
  CHECK(kind_of([&] {
          hoist::resolve_credentials(
              hoist::credential_source{ .type = hoist::credential_source::kind::FILE,
                                        .file = path },
              "ghcr.io",
              fake_env({}));
        }) == hoist::error_kind::CREDENTIAL_INVALID);
  std::filesystem::remove(path);
}

TEST_CASE("resolve_credentials rejects unknown keys in secret file") {
  auto const path{ write_secret_file("username=u\npassword=t0k3n\n", 0600) };
  CHECK(kind_of([&] {
          hoist::resolve_credentials(
              hoist::credential_source{ .type = hoist::credential_source::kind::FILE,
                                        .file = path },
              "ghcr.io",
              fake_env({}));
        }) == hoist::error_kind::CREDENTIAL_INVALID);
  std::filesystem::remove(path);
}

TEST_CASE("credentials_server_is_valid") {
  CHECK(hoist::credentials_server_is_valid("ghcr.io"));
  CHECK(hoist::credentials_server_is_valid("localhost:5000"));
  CHECK(hoist::credentials_server_is_valid("registry-1.docker.io"));
  CHECK_FALSE(hoist::credentials_server_is_valid("https://ghcr.io"));
  CHECK_FALSE(hoist::credentials_server_is_valid("ghcr.io/henn-dt"));
  CHECK_FALSE(hoist::credentials_server_is_valid("host:99999"));
  CHECK_FALSE(hoist::credentials_server_is_valid("-bad.io"));
  CHECK_FALSE(hoist::credentials_server_is_valid(""));
}

TEST_CASE("resolve_credentials rejects tokens too short to redact") {
  try {
    hoist::resolve_credentials({},
                               "ghcr.io",
                               fake_env({ { hoist::kEnvUsername, "henn-dt" },
                                          { hoist::kEnvToken, "q7z" } }));
    FAIL("expected CredentialInvalid");
  } catch (hoist::publish_error const &e) {
    CHECK(e.kind() == hoist::error_kind::CREDENTIAL_INVALID);
    CHECK(std::string{ e.what() }.find("q7z") == std::string::npos);
  }
  CHECK(hoist::tui::apply_redactions("q7z") == "q7z");

  auto const cred{ hoist::resolve_credentials({},
                                              "ghcr.io",
                                              fake_env({ { hoist::kEnvUsername, "henn-dt" },
                                                         { hoist::kEnvToken, "q7zk" } })) };
  CHECK(cred.token.reveal() == "q7zk");
  CHECK(hoist::tui::apply_redactions("token q7zk") == "token ***");
  hoist::tui::clear_redactions();
}
