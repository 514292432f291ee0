#include "cmd_version.h"

#include "tui.h"

#include <CLI/CLI.hpp>
#include <curl/curl.h>
#include <mbedtls/version.h>
#include <sol/sol.hpp>
#include <tbb/version.h>

#include <array>

#ifndef HOIST_VERSION_STR
#error "HOIST_VERSION_STR must be defined by the build system"
#endif

namespace hoist {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_version::cmd_version(cmd_version::cfg cfg) : cfg_{ std::move(cfg) } {}

exit_status cmd_version::execute() {
  tui::info("hoist version %s", HOIST_VERSION_STR);
  tui::info("");
  tui::info("Third-party component versions:");

  curl_version_info_data const *curl_info{ curl_version_info(CURLVERSION_NOW) };
  tui::info("  libcurl: %s (%s)", curl_info->version, curl_info->ssl_version
                                                         ? curl_info->ssl_version
                                                         : "no TLS");

  std::array<char, 32> mbedtls_version{};
  mbedtls_version_get_string_full(mbedtls_version.data());
  tui::info("  mbedTLS: %s", mbedtls_version.data());

  tui::info("  oneTBB: %s", TBB_runtime_version());
  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  CLI11: %s", CLI11_VERSION);
  return exit_status::SUCCESS;
}

}  // namespace hoist
