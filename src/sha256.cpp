#include "sha256.h"

#include "mbedtls/sha256.h"
#include "util.h"

#include <cctype>
#include <memory>
#include <stdexcept>

namespace hoist {

namespace {

constexpr std::string_view kDigestPrefix{ "sha256:" };

}  // namespace

sha256_t sha256(std::string_view data) {
  mbedtls_sha256_context ctx;
  mbedtls_sha256_init(&ctx);

  std::unique_ptr<decltype(ctx), decltype(&mbedtls_sha256_free)> ctx_scope(
      &ctx,
      &mbedtls_sha256_free);

  if (mbedtls_sha256_starts(&ctx, 0)) {
    throw std::runtime_error("sha256: mbedtls_sha256_starts failed");
  }

  if (!data.empty() &&
      mbedtls_sha256_update(&ctx,
                            reinterpret_cast<unsigned char const *>(data.data()),
                            data.size())) {
    throw std::runtime_error("sha256: mbedtls_sha256_update failed");
  }

  sha256_t digest{};
  if (mbedtls_sha256_finish(&ctx, digest.data())) {
    throw std::runtime_error("sha256: mbedtls_sha256_finish failed");
  }

  return digest;
}

std::string sha256_digest_string(sha256_t const &hash) {
  return std::string{ kDigestPrefix } + util_bytes_to_hex(hash.data(), hash.size());
}

bool sha256_is_digest(std::string_view digest) {
  if (digest.size() != kDigestPrefix.size() + 64) { return false; }
  if (digest.substr(0, kDigestPrefix.size()) != kDigestPrefix) { return false; }
  for (char const c : digest.substr(kDigestPrefix.size())) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) { return false; }
  }
  return true;
}

bool sha256_digest_equal(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) { return false; }
  for (size_t i{ 0 }; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace hoist
