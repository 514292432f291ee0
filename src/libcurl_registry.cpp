#include "libcurl_registry.h"

#include "sha256.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace hoist {

namespace {

constexpr char kUserAgent[]{ "hoist/1" };
constexpr size_t kMaxBodyBytes{ 4 * 1024 * 1024 };

constexpr char kManifestAccept[]{
  "Accept: application/vnd.oci.image.index.v1+json, "
  "application/vnd.docker.distribution.manifest.list.v2+json, "
  "application/vnd.oci.image.manifest.v1+json, "
  "application/vnd.docker.distribution.manifest.v2+json"
};

struct http_request {
  std::string url;
  std::vector<std::string> headers;
  std::string basic_user;
  secret const *basic_password{ nullptr };
};

struct http_response {
  CURLcode code{ CURLE_OK };
  long status{ 0 };
  std::string body;
  std::map<std::string, std::string> headers;  // lowercase names
};

std::string lowercase(std::string_view s) {
  std::string out{ s };
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

size_t curl_write_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *body{ static_cast<std::string *>(userdata) };
  size_t const total{ size * nmemb };
  if (body->size() + total > kMaxBodyBytes) { return 0; }
  body->append(ptr, total);
  return total;
}

size_t curl_write_header(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *headers{ static_cast<std::map<std::string, std::string> *>(userdata) };
  size_t const total{ size * nmemb };
  std::string_view const line{ ptr, total };

  if (line.starts_with("HTTP/")) {
    headers->clear();  // new response after a redirect
  } else if (auto const colon{ line.find(':') }; colon != std::string_view::npos) {
    (*headers)[lowercase(util_trim(line.substr(0, colon)))] =
        std::string{ util_trim(line.substr(colon + 1)) };
  }
  return total;
}

int curl_xferinfo(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  auto const *limits{ static_cast<call_limits const *>(clientp) };
  return limits->cancelled() ? 1 : 0;
}

using curl_slist_ptr = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

http_response perform(http_request const &req, call_limits const &limits) {
  libcurl_ensure_initialized();

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle{ curl_easy_init(),
                                                              &curl_easy_cleanup };
  if (!handle) { throw std::runtime_error("curl_easy_init failed"); }

  auto const setopt = [handle = handle.get()](auto option, auto value) {
    CURLcode const rc{ curl_easy_setopt(handle, option, value) };
    if (rc != CURLE_OK) {
      throw std::runtime_error(std::string("curl_easy_setopt failed: ") +
                               curl_easy_strerror(rc));
    }
  };

  curl_slist_ptr header_list{ nullptr, &curl_slist_free_all };
  for (auto const &h : req.headers) {
    curl_slist *next{ curl_slist_append(header_list.get(), h.c_str()) };
    if (!next) { throw std::runtime_error("curl_slist_append failed"); }
    static_cast<void>(header_list.release());
    header_list.reset(next);
  }

  auto const remaining_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                               limits.deadline - std::chrono::steady_clock::now())
                               .count() };

  http_response response;
  if (remaining_ms <= 0) {
    response.code = CURLE_OPERATION_TIMEDOUT;
    return response;
  }

  setopt(CURLOPT_URL, req.url.c_str());
  setopt(CURLOPT_FOLLOWLOCATION, 1L);
  setopt(CURLOPT_MAXREDIRS, 5L);
  setopt(CURLOPT_NOSIGNAL, 1L);
  setopt(CURLOPT_USERAGENT, kUserAgent);
  setopt(CURLOPT_TIMEOUT_MS, static_cast<long>(remaining_ms));
  setopt(CURLOPT_WRITEFUNCTION, curl_write_body);
  setopt(CURLOPT_WRITEDATA, &response.body);
  setopt(CURLOPT_HEADERFUNCTION, curl_write_header);
  setopt(CURLOPT_HEADERDATA, &response.headers);
  setopt(CURLOPT_NOPROGRESS, 0L);
  setopt(CURLOPT_XFERINFOFUNCTION, curl_xferinfo);
  setopt(CURLOPT_XFERINFODATA, const_cast<call_limits *>(&limits));
  if (header_list) { setopt(CURLOPT_HTTPHEADER, header_list.get()); }

  secret const password{ std::string{
      req.basic_password ? req.basic_password->reveal() : std::string_view{} } };
  if (req.basic_password) {
    setopt(CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
    setopt(CURLOPT_USERNAME, req.basic_user.c_str());
    setopt(CURLOPT_PASSWORD, password.reveal().data());  // backed by a NUL-terminated string
  }

  auto const start{ std::chrono::steady_clock::now() };
  response.code = curl_easy_perform(handle.get());
  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status);

  HOIST_TRACE_HTTP_REQUEST(
      "GET",
      req.url,
      response.status,
      static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - start)
                                    .count()));
  tui::debug("GET %s -> %ld (%s)",
             req.url.c_str(),
             response.status,
             curl_easy_strerror(response.code));
  return response;
}

// Maps transport-level failures; returns normally if an HTTP status arrived
void check_transport(http_response const &r,
                     publish_stage stage,
                     std::string const &subject,
                     call_limits const &limits) {
  if (r.code == CURLE_OK) { return; }
  if (r.code == CURLE_ABORTED_BY_CALLBACK || limits.cancelled()) {
    throw publish_error::cancelled(stage, subject);
  }
  if (r.code == CURLE_OPERATION_TIMEDOUT) { throw publish_error::timeout(stage, subject); }

  std::string const reason{ curl_easy_strerror(r.code) };
  if (stage == publish_stage::LOGIN) {
    throw publish_error::auth_failed(subject, r.status, reason);
  }
  throw publish_error::push_failed(subject, reason);
}

std::string url_encode(std::string_view s) {
  std::string out;
  for (char const c : s) {
    auto const uc{ static_cast<unsigned char>(c) };
    if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(c);
    } else {
      char buf[4]{};
      std::snprintf(buf, sizeof buf, "%%%02X", uc);
      out.append(buf);
    }
  }
  return out;
}

}  // namespace

void libcurl_ensure_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    CURLcode const code{ curl_global_init(CURL_GLOBAL_DEFAULT) };
    if (code != CURLE_OK) {
      throw std::runtime_error(std::string("curl_global_init failed: ") +
                               curl_easy_strerror(code));
    }
  });
}

std::optional<auth_challenge> registry_parse_challenge(std::string_view header) {
  header = util_trim(header);
  auto const space{ header.find(' ') };
  if (header.empty()) { return std::nullopt; }

  auth_challenge challenge{ .scheme = std::string{ header.substr(0, space) }, .params = {} };
  if (space == std::string_view::npos) { return challenge; }

  auto rest{ header.substr(space + 1) };
  while (!rest.empty()) {
    rest = util_trim(rest);
    auto const eq{ rest.find('=') };
    if (eq == std::string_view::npos) { break; }
    auto key{ lowercase(util_trim(rest.substr(0, eq))) };
    rest.remove_prefix(eq + 1);

    std::string value;
    if (!rest.empty() && rest.front() == '"') {
      rest.remove_prefix(1);
      while (!rest.empty() && rest.front() != '"') {
        if (rest.front() == '\\' && rest.size() > 1) { rest.remove_prefix(1); }
        value.push_back(rest.front());
        rest.remove_prefix(1);
      }
      if (!rest.empty()) { rest.remove_prefix(1); }  // closing quote
    } else {
      auto const comma{ rest.find(',') };
      value = std::string{ util_trim(rest.substr(0, comma)) };
      rest = comma == std::string_view::npos ? std::string_view{} : rest.substr(comma);
    }
    challenge.params[std::move(key)] = std::move(value);

    rest = util_trim(rest);
    if (!rest.empty() && rest.front() == ',') { rest.remove_prefix(1); }
  }
  return challenge;
}

std::optional<std::string> registry_json_string_field(std::string_view body,
                                                      std::string_view key) {
  std::string const needle{ "\"" + std::string{ key } + "\"" };

  for (auto pos{ body.find(needle) }; pos != std::string_view::npos;
       pos = body.find(needle, pos + 1)) {
    auto rest{ body.substr(pos + needle.size()) };
    rest = util_trim(rest);
    if (rest.empty() || rest.front() != ':') { continue; }
    rest = util_trim(rest.substr(1));
    if (rest.empty() || rest.front() != '"') { return std::nullopt; }
    rest.remove_prefix(1);

    std::string value;
    while (!rest.empty() && rest.front() != '"') {
      if (rest.front() == '\\' && rest.size() > 1) {
        rest.remove_prefix(1);
        switch (rest.front()) {
          case 'n': value.push_back('\n'); break;
          case 't': value.push_back('\t'); break;
          case 'r': value.push_back('\r'); break;
          case 'b': value.push_back('\b'); break;
          case 'f': value.push_back('\f'); break;
          default: value.push_back(rest.front()); break;  // \" \\ \/
        }
      } else {
        value.push_back(rest.front());
      }
      rest.remove_prefix(1);
    }
    if (rest.empty()) { return std::nullopt; }  // unterminated
    return value;
  }
  return std::nullopt;
}

libcurl_registry::libcurl_registry(std::string scheme) : scheme_{ std::move(scheme) } {}

session libcurl_registry::authenticate(registry_credential const &credential,
                                       std::string const &repository,
                                       call_limits const &limits) {
  auto const &server{ credential.server };
  auto const ping_url{ scheme_ + "://" + server + "/v2/" };

  auto const ping{ perform(http_request{ .url = ping_url }, limits) };
  check_transport(ping, publish_stage::LOGIN, server, limits);

  session s{ .server = server,
             .repository = repository,
             .username = credential.username,
             .authorization = {},
             .engine_config = {} };

  if (ping.status == 200) {
    tui::debug("Registry %s accepts anonymous requests", server.c_str());
    return s;
  }
  if (ping.status != 401) {
    throw publish_error::auth_failed(server, ping.status, "unexpected /v2/ response");
  }

  auto const header{ ping.headers.find("www-authenticate") };
  auto const challenge{ header == ping.headers.end()
                            ? std::nullopt
                            : registry_parse_challenge(header->second) };
  if (!challenge) {
    throw publish_error::auth_failed(server, ping.status, "no WWW-Authenticate challenge");
  }

  if (lowercase(challenge->scheme) == "basic") {
    auto const check{ perform(http_request{ .url = ping_url,
                                            .headers = {},
                                            .basic_user = credential.username,
                                            .basic_password = &credential.token },
                              limits) };
    check_transport(check, publish_stage::LOGIN, server, limits);
    if (check.status != 200) { throw publish_error::auth_failed(server, check.status); }

    s.authorization = secret{ "Basic " + util_base64_encode(credential.username + ":" +
                                                            std::string{
                                                                credential.token.reveal() }) };
    return s;
  }

  if (lowercase(challenge->scheme) != "bearer") {
    throw publish_error::auth_failed(server,
                                     ping.status,
                                     "unsupported auth scheme " + challenge->scheme);
  }

  auto const realm{ challenge->params.find("realm") };
  if (realm == challenge->params.end() || realm->second.empty()) {
    throw publish_error::auth_failed(server, ping.status, "Bearer challenge without realm");
  }

  std::string token_url{ realm->second };
  token_url += realm->second.find('?') == std::string::npos ? '?' : '&';
  if (auto const service{ challenge->params.find("service") };
      service != challenge->params.end()) {
    token_url += "service=" + url_encode(service->second) + "&";
  }
  token_url += "scope=" + url_encode("repository:" + repository + ":pull,push");

  auto const exchange{ perform(http_request{ .url = token_url,
                                             .headers = {},
                                             .basic_user = credential.username,
                                             .basic_password = &credential.token },
                               limits) };
  check_transport(exchange, publish_stage::LOGIN, server, limits);
  if (exchange.status != 200) { throw publish_error::auth_failed(server, exchange.status); }

  auto token{ registry_json_string_field(exchange.body, "token") };
  if (!token || token->empty()) {
    token = registry_json_string_field(exchange.body, "access_token");
  }
  if (!token || token->empty()) {
    throw publish_error::auth_failed(server, exchange.status, "token response had no token");
  }

  tui::redact(*token);
  s.authorization = secret{ "Bearer " + *token };
  return s;
}

std::string libcurl_registry::manifest_digest(session const &s,
                                              publish_target const &target,
                                              call_limits const &limits) {
  auto const reference{ target.reference() };

  http_request req{ .url = scheme_ + "://" + target.registry + "/v2/" + target.repository +
                           "/manifests/" + target.tag,
                    .headers = { kManifestAccept } };
  if (!s.authorization.empty()) {
    req.headers.push_back("Authorization: " + std::string{ s.authorization.reveal() });
  }

  auto const response{ perform(req, limits) };
  check_transport(response, publish_stage::PUSH, reference, limits);

  if (response.status != 200) {
    throw publish_error::push_failed(reference,
                                     "registry answered manifest lookup with status " +
                                         std::to_string(response.status));
  }

  auto const body_digest{ sha256_digest_string(sha256(response.body)) };
  if (auto const header{ response.headers.find("docker-content-digest") };
      header != response.headers.end() && !sha256_digest_equal(header->second, body_digest)) {
    throw publish_error::digest_mismatch(reference, header->second, body_digest);
  }
  return body_digest;
}

}  // namespace hoist
