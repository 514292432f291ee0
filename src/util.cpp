#include "util.h"

#include "mbedtls/base64.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace hoist {

std::string util_bytes_to_hex(void const *data, size_t length) {
  static constexpr char hex_chars[] = "0123456789abcdef";

  auto const bytes = static_cast<unsigned char const *>(data);
  std::string result;
  result.reserve(length * 2);

  for (size_t i{}; i < length; ++i) {
    result += hex_chars[(bytes[i] >> 4) & 0xf];
    result += hex_chars[bytes[i] & 0xf];
  }

  return result;
}

std::string util_base64_encode(std::string_view data) {
  auto const *src{ reinterpret_cast<unsigned char const *>(data.data()) };

  size_t required{ 0 };
  // Sizing call: reports MBEDTLS_ERR_BASE64_BUFFER_TOO_SMALL and the needed length
  static_cast<void>(mbedtls_base64_encode(nullptr, 0, &required, src, data.size()));

  std::string out(required, '\0');
  size_t written{ 0 };
  if (mbedtls_base64_encode(reinterpret_cast<unsigned char *>(out.data()),
                            out.size(),
                            &written,
                            src,
                            data.size()) != 0) {
    throw std::runtime_error("util_base64_encode: mbedtls_base64_encode failed");
  }

  out.resize(written);  // excludes mbedtls' trailing NUL
  return out;
}

void util_append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

std::string_view util_trim(std::string_view s) {
  constexpr std::string_view kWhitespace{ " \t\r\n" };
  auto const first{ s.find_first_not_of(kWhitespace) };
  if (first == std::string_view::npos) { return {}; }
  auto const last{ s.find_last_not_of(kWhitespace) };
  return s.substr(first, last - first + 1);
}

std::vector<std::string> util_split(std::string_view s, char delim) {
  std::vector<std::string> tokens;
  for (;;) {
    auto const pos{ s.find(delim) };
    tokens.emplace_back(s.substr(0, pos));
    if (pos == std::string_view::npos) { break; }
    s.remove_prefix(pos + 1);
  }
  return tokens;
}

std::string util_tail_lines(std::string_view text, size_t max_lines) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.remove_suffix(1);
  }
  if (max_lines == 0 || text.empty()) { return {}; }

  size_t pos{ text.size() };
  size_t lines{ 0 };
  while (pos > 0) {
    auto const nl{ text.rfind('\n', pos - 1) };
    if (nl == std::string_view::npos) { return std::string{ text }; }
    if (++lines == max_lines) { return std::string{ text.substr(nl + 1) }; }
    pos = nl;
  }
  return std::string{ text };
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::vector<unsigned char> buffer(static_cast<size_t>(file_size));
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

std::filesystem::path util_make_private_temp_dir(std::string_view prefix) {
  auto pattern{ (std::filesystem::temp_directory_path() /
                 (std::string{ prefix } + "XXXXXX"))
                    .string() };
  if (!::mkdtemp(pattern.data())) {  // mkdtemp creates the directory 0700
    throw std::system_error(errno, std::generic_category(), "mkdtemp " + pattern);
  }
  return pattern;
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

}  // namespace hoist
