#include "cmd_common.h"

#include "manifest.h"
#include "publish_error.h"
#include "tui.h"
#include "util.h"

#include <cstdio>
#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>

namespace hoist {

std::unique_ptr<manifest> load_manifest_or_throw(
    std::optional<std::filesystem::path> const &manifest_path) {
  auto const path{ manifest::find_manifest_path(manifest_path) };
  auto m{ manifest::load(path) };
  if (!m) { throw publish_error::config_invalid("could not load manifest"); }
  return m;
}

void write_report_file(std::filesystem::path const &path, std::string_view content) {
  auto const text{ tui::apply_redactions(std::string{ content }) };

  auto tmp{ path };
  tmp += ".tmp";
  scoped_path_cleanup cleanup{ tmp };

  {
    auto file{ util_open_file(tmp, "wb") };
    if (!file) { throw std::runtime_error("failed to open " + tmp.string()); }
    if (std::fwrite(text.data(), 1, text.size(), file.get()) != text.size()) {
      throw std::runtime_error("failed to write " + tmp.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    throw std::runtime_error("failed to write " + path.string() + ": " + ec.message());
  }
}

bool try_write_report_file(std::filesystem::path const &path, std::string_view content) {
  try {
    write_report_file(path, content);
    return true;
  } catch (std::exception const &e) {
    tui::error("%s", e.what());
    return false;
  }
}

}  // namespace hoist
