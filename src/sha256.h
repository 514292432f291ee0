#pragma once

#include <array>
#include <string>
#include <string_view>

namespace hoist {

using sha256_t = std::array<unsigned char, 32>;

sha256_t sha256(std::string_view data);

// "sha256:<64 lowercase hex>" form used by registries for content digests
std::string sha256_digest_string(sha256_t const &hash);

// True if `digest` is "sha256:" followed by 64 hex characters
bool sha256_is_digest(std::string_view digest);

// Compare two "sha256:..." digests, ignoring hex case
bool sha256_digest_equal(std::string_view a, std::string_view b);

}  // namespace hoist
