#include "credentials.h"

#include "tui.h"
#include "util.h"

#include <sys/stat.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <map>
#include <utility>

namespace hoist {

namespace {

constexpr size_t kMaxLabelLength{ 63 };
constexpr size_t kMaxHostLength{ 253 };

struct raw_fields {
  std::optional<std::string> server;
  std::optional<std::string> username;
  std::optional<std::string> token;
  std::optional<std::string> email;
};

bool label_is_valid(std::string_view label) {
  if (label.empty() || label.size() > kMaxLabelLength) { return false; }
  if (label.front() == '-' || label.back() == '-') { return false; }
  for (char const c : label) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') { return false; }
  }
  return true;
}

raw_fields read_env(env_lookup_fn const &env) {
  return raw_fields{ .server = env(kEnvServer),
                     .username = env(kEnvUsername),
                     .token = env(kEnvToken),
                     .email = env(kEnvEmail) };
}

raw_fields read_file(std::filesystem::path const &path) {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    throw publish_error::credential_invalid("file",
                                            "cannot stat " + path.string() + ": " +
                                                std::strerror(errno));
  }
  if (!S_ISREG(st.st_mode)) {
    throw publish_error::credential_invalid("file", path.string() + " is not a regular file");
  }
  if ((st.st_mode & (S_IRWXG | S_IRWXO)) != 0) {
    throw publish_error::credential_invalid(
        "file",
        path.string() + " must not be accessible by group or others (chmod 600)");
  }

  std::vector<unsigned char> bytes;
  try {
    bytes = util_load_file(path);
  } catch (std::runtime_error const &e) {
    throw publish_error::credential_invalid("file", e.what());
  }

  std::string content{ bytes.begin(), bytes.end() };
  // Wipe the raw copy once parsed; only the extracted fields survive
  for (auto &b : bytes) { static_cast<volatile unsigned char &>(b) = 0; }

  raw_fields fields;
  std::map<std::string_view, std::optional<std::string> *> const slots{
    { "server", &fields.server },
    { "username", &fields.username },
    { "token", &fields.token },
    { "email", &fields.email },
  };

  size_t line_no{ 0 };
  for (auto const &raw_line : util_split(content, '\n')) {
    ++line_no;
    auto const line{ util_trim(raw_line) };
    if (line.empty() || line.front() == '#') { continue; }

    auto const eq{ line.find('=') };
    if (eq == std::string_view::npos) {
      throw publish_error::credential_invalid(
          "file",
          path.string() + ":" + std::to_string(line_no) + ": expected key=value");
    }

    auto const key{ util_trim(line.substr(0, eq)) };
    auto const it{ slots.find(key) };
    if (it == slots.end()) {
      throw publish_error::credential_invalid("file",
                                              path.string() + ":" +
                                                  std::to_string(line_no) +
                                                  ": unknown key '" + std::string{ key } +
                                                  "'");
    }
    *it->second = std::string{ util_trim(line.substr(eq + 1)) };
  }

  for (auto &c : content) { static_cast<volatile char &>(c) = '\0'; }
  return fields;
}

std::string take_required(std::optional<std::string> &value, std::string_view field) {
  if (!value || util_trim(*value).empty()) {
    throw publish_error::credential_missing(field);
  }
  return std::string{ util_trim(*value) };
}

}  // namespace

credential_source credential_source::parse(std::string_view spec) {
  if (spec.empty() || spec == "env") { return credential_source{}; }

  constexpr std::string_view kFilePrefix{ "file:" };
  if (spec.starts_with(kFilePrefix) && spec.size() > kFilePrefix.size()) {
    return credential_source{ .type = kind::FILE,
                              .file = std::filesystem::path{
                                  spec.substr(kFilePrefix.size()) } };
  }

  throw publish_error::config_invalid("credential source must be 'env' or 'file:<path>', got '" +
                                      std::string{ spec } + "'");
}

env_lookup_fn credentials_process_env() {
  return [](std::string_view name) -> std::optional<std::string> {
    if (char const *value{ std::getenv(std::string{ name }.c_str()) }) {
      return std::string{ value };
    }
    return std::nullopt;
  };
}

bool credentials_server_is_valid(std::string_view server) {
  if (server.empty()) { return false; }

  auto host{ server };
  if (auto const colon{ server.rfind(':') }; colon != std::string_view::npos) {
    auto const port{ server.substr(colon + 1) };
    if (port.empty() || port.size() > 5) { return false; }
    long value{ 0 };
    for (char const c : port) {
      if (!std::isdigit(static_cast<unsigned char>(c))) { return false; }
      value = value * 10 + (c - '0');
    }
    if (value < 1 || value > 65535) { return false; }
    host = server.substr(0, colon);
  }

  if (host.empty() || host.size() > kMaxHostLength) { return false; }

  for (auto const &label : util_split(host, '.')) {
    if (!label_is_valid(label)) { return false; }
  }
  return true;
}

registry_credential resolve_credentials(credential_source const &source,
                                        std::string_view default_server,
                                        env_lookup_fn const &env) {
  raw_fields fields{ source.type == credential_source::kind::FILE ? read_file(source.file)
                                                                  : read_env(env) };

  if ((!fields.server || util_trim(*fields.server).empty()) && !default_server.empty()) {
    fields.server = std::string{ default_server };
  }

  registry_credential cred{ .server = take_required(fields.server, "server"),
                            .username = take_required(fields.username, "username"),
                            .token = secret{ take_required(fields.token, "token") },
                            .email = std::string{ util_trim(fields.email.value_or("")) } };

  if (!credentials_server_is_valid(cred.server)) {
    throw publish_error::credential_invalid(
        "server",
        "'" + cred.server + "' is not a well-formed host[:port]");
  }

  if (cred.token.reveal().size() < tui::kMinRedactionLength) {
    throw publish_error::credential_invalid(
        "token",
        "shorter than " + std::to_string(tui::kMinRedactionLength) + " characters");
  }

  tui::redact(cred.token.reveal());
  tui::redact(util_base64_encode(cred.username + ":" + std::string{ cred.token.reveal() }));

  tui::debug("Resolved registry credentials for %s@%s",
             cred.username.c_str(),
             cred.server.c_str());
  return cred;
}

}  // namespace hoist
