#pragma once

#include "publish_types.h"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace hoist {

// Fixed naming convention from the manifest TAGS table:
//   default variant       -> {base}
//   variant under `with`  -> {base}-with-{component}
struct tag_convention {
  std::string base;
  std::string default_variant;
  std::map<std::string, std::string> with;  // variant name -> component
};

// [A-Za-z0-9_][A-Za-z0-9._-]{0,127}
bool tag_is_valid(std::string_view tag);

// Canonical tag for one variant name. Throws UnknownVariant.
std::string tag_for_variant(std::string_view variant_name, tag_convention const &tags);

// Targets for `variant` under registry/repository. Pure and deterministic.
// Throws UnknownVariant, or ConfigInvalid if the resulting tag is malformed.
std::vector<publish_target> resolve_tags(image_variant const &variant,
                                         tag_convention const &tags,
                                         std::string_view registry,
                                         std::string_view repository);

// Resolve every variant up front; also rejects two variants mapping to one tag.
std::vector<std::vector<publish_target>> resolve_all_tags(
    std::vector<image_variant> const &variants,
    tag_convention const &tags,
    std::string_view registry,
    std::string_view repository);

}  // namespace hoist
