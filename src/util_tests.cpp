#include "util.h"

#include <doctest/doctest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <variant>
#include <vector>

namespace {

std::filesystem::path make_temp_path(char const *tag) {
  static std::atomic<int> counter{ 0 };
  auto const id = counter.fetch_add(1, std::memory_order_relaxed);
  auto base{ std::filesystem::temp_directory_path() };
  return base / ("hoist-util-test-" + std::string(tag) + "-" + std::to_string(id));
}

}  // namespace

TEST_CASE("match with std::variant of int and string") {
  using var_t = std::variant<int, std::string>;

  var_t v1{ 42 };
  var_t v2{ std::string("hello") };

  auto const visitor{ hoist::match{
      [](int x) { return x * 2; },
      [](std::string const &s) { return static_cast<int>(s.size()); } } };

  CHECK(std::visit(visitor, v1) == 84);
  CHECK(std::visit(visitor, v2) == 5);
}

TEST_CASE("util_bytes_to_hex") {
  unsigned char const bytes[]{ 0x00, 0x0f, 0xa0, 0xff };
  CHECK(hoist::util_bytes_to_hex(bytes, sizeof bytes) == "000fa0ff");
  CHECK(hoist::util_bytes_to_hex(bytes, 0).empty());
}

TEST_CASE("util_base64_encode pads per RFC 4648") {
  CHECK(hoist::util_base64_encode("") == "");
  CHECK(hoist::util_base64_encode("f") == "Zg==");
  CHECK(hoist::util_base64_encode("fo") == "Zm8=");
  CHECK(hoist::util_base64_encode("foo") == "Zm9v");
  CHECK(hoist::util_base64_encode("user:token") == "dXNlcjp0b2tlbg==");
}

TEST_CASE("util_append_json_string escapes quotes, backslashes and controls") {
  std::string out{ "x=" };
  hoist::util_append_json_string(out, "a\"b\\c\nd\te\x01");
  CHECK(out == "x=a\\\"b\\\\c\\nd\\te\\u0001");
}

TEST_CASE("util_trim") {
  CHECK(hoist::util_trim("  abc \r\n") == "abc");
  CHECK(hoist::util_trim("\t\t").empty());
  CHECK(hoist::util_trim("a b") == "a b");
}

TEST_CASE("util_split keeps empty tokens") {
  CHECK(hoist::util_split("a,b,,c", ',') == std::vector<std::string>{ "a", "b", "", "c" });
  CHECK(hoist::util_split("", ',') == std::vector<std::string>{ "" });
  CHECK(hoist::util_split("linux/arm64/v8", '/') ==
        std::vector<std::string>{ "linux", "arm64", "v8" });
}

TEST_CASE("util_tail_lines") {
  CHECK(hoist::util_tail_lines("1\n2\n3\n4\n", 2) == "3\n4");
  CHECK(hoist::util_tail_lines("1\n2", 5) == "1\n2");
  CHECK(hoist::util_tail_lines("", 3).empty());
}

TEST_CASE("util_load_file reads whole file") {
  auto const path{ make_temp_path("load") };
  hoist::scoped_path_cleanup cleanup{ path };
  {
    std::ofstream out{ path, std::ios::binary };
    out << "hoist-test";
  }

  auto const bytes{ hoist::util_load_file(path) };
  CHECK(std::string(bytes.begin(), bytes.end()) == "hoist-test");
}

TEST_CASE("util_load_file throws for missing file") {
  CHECK_THROWS_AS(hoist::util_load_file(make_temp_path("missing")), std::runtime_error);
}

TEST_CASE("scoped_path_cleanup removes path on destruction") {
  auto const path{ make_temp_path("cleanup") };
  {
    std::ofstream out{ path };
    out << "x";
  }
  REQUIRE(std::filesystem::exists(path));
  { hoist::scoped_path_cleanup cleanup{ path }; }
  CHECK_FALSE(std::filesystem::exists(path));
}

TEST_CASE("scoped_path_cleanup reset moves ownership to the new path") {
  auto const first{ make_temp_path("reset-a") };
  auto const second{ make_temp_path("reset-b") };
  for (auto const &p : { first, second }) {
    std::ofstream out{ p };
    out << "x";
  }

  {
    hoist::scoped_path_cleanup cleanup{ first };
    cleanup.reset(second);
    CHECK_FALSE(std::filesystem::exists(first));
    CHECK(std::filesystem::exists(second));
  }
  CHECK_FALSE(std::filesystem::exists(second));
}

TEST_CASE("util_make_private_temp_dir creates a fresh owner-only directory") {
  namespace fs = std::filesystem;
  auto const a{ hoist::util_make_private_temp_dir("hoist-util-test-") };
  auto const b{ hoist::util_make_private_temp_dir("hoist-util-test-") };
  hoist::scoped_path_cleanup const cleanup_a{ a };
  hoist::scoped_path_cleanup const cleanup_b{ b };

  CHECK(a != b);
  CHECK(fs::is_directory(a));
  CHECK(a.parent_path() == fs::temp_directory_path());
  CHECK(a.filename().string().starts_with("hoist-util-test-"));
  CHECK((fs::status(a).permissions() & fs::perms::all) == fs::perms::owner_all);
}

TEST_CASE("scoped_path_cleanup removes a populated directory") {
  auto const dir{ hoist::util_make_private_temp_dir("hoist-util-test-") };
  {
    hoist::scoped_path_cleanup cleanup{ dir };
    std::filesystem::create_directories(dir / "nested");
    std::ofstream out{ dir / "nested" / "config.json" };
    out << "{}";
  }
  CHECK_FALSE(std::filesystem::exists(dir));
}
