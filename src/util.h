#pragma once

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace hoist {

struct uncopyable {
  uncopyable() = default;
  uncopyable(uncopyable &&) = default;
  uncopyable &operator=(uncopyable &&) = default;
};

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// Convert bytes to lowercase hex string
std::string util_bytes_to_hex(void const *data, size_t length);

// Standard base64 (RFC 4648, padded)
std::string util_base64_encode(std::string_view data);

// Append `value` to `out` with JSON string escaping (no surrounding quotes)
void util_append_json_string(std::string &out, std::string_view value);

// Strip leading/trailing spaces, tabs, CR and LF
std::string_view util_trim(std::string_view s);

// Split on a single-character delimiter; empty tokens are kept
std::vector<std::string> util_split(std::string_view s, char delim);

// Keep the last `max_lines` lines of `text` (for stderr tails in error reports)
std::string util_tail_lines(std::string_view text, size_t max_lines);

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory as bytes.
// Throws std::runtime_error if file cannot be opened or read.
std::vector<unsigned char> util_load_file(std::filesystem::path const &path);

// Fresh directory under the system temp dir, mode 0700. Throws std::system_error.
std::filesystem::path util_make_private_temp_dir(std::string_view prefix);

// Removes `path` (recursively, for directories) on destruction
class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace hoist
