#include "cmds/cmd_common.h"

#include "util.h"

#include <doctest/doctest.h>

#include <filesystem>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace {

std::string read_text(fs::path const &path) {
  auto const bytes{ hoist::util_load_file(path) };
  return std::string(bytes.begin(), bytes.end());
}

}  // namespace

TEST_CASE("write_report_file replaces the target and leaves no temp file") {
  hoist::scoped_path_cleanup const dir{ hoist::util_make_private_temp_dir("hoist-report-") };
  auto const out{ dir.path() / "summary.json" };

  hoist::write_report_file(out, "{\"old\":true}\n");
  hoist::write_report_file(out, "{\"published\":[]}\n");

  CHECK(read_text(out) == "{\"published\":[]}\n");
  CHECK_FALSE(fs::exists(fs::path{ out.string() + ".tmp" }));
}

TEST_CASE("try_write_report_file reports failure instead of throwing") {
  hoist::scoped_path_cleanup const dir{ hoist::util_make_private_temp_dir("hoist-report-") };
  auto const unwritable{ dir.path() / "missing-dir" / "summary.json" };

  CHECK_THROWS_AS(hoist::write_report_file(unwritable, "{}\n"), std::runtime_error);

  bool ok{ true };
  CHECK_NOTHROW(ok = hoist::try_write_report_file(unwritable, "{}\n"));
  CHECK_FALSE(ok);
  CHECK_FALSE(fs::exists(unwritable));

  auto const good{ dir.path() / "summary.json" };
  CHECK(hoist::try_write_report_file(good, "{}\n"));
  CHECK(read_text(good) == "{}\n");
}
