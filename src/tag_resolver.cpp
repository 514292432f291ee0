#include "tag_resolver.h"

#include <cctype>
#include <unordered_map>
#include <utility>

namespace hoist {

namespace {

constexpr size_t kMaxTagLength{ 128 };

bool is_tag_char(char c, bool first) {
  auto const uc{ static_cast<unsigned char>(c) };
  if (std::isalnum(uc) || c == '_') { return true; }
  return !first && (c == '.' || c == '-');
}

}  // namespace

bool tag_is_valid(std::string_view tag) {
  if (tag.empty() || tag.size() > kMaxTagLength) { return false; }
  for (size_t i{ 0 }; i < tag.size(); ++i) {
    if (!is_tag_char(tag[i], i == 0)) { return false; }
  }
  return true;
}

std::string tag_for_variant(std::string_view variant_name, tag_convention const &tags) {
  if (variant_name == tags.default_variant) { return tags.base; }

  if (auto const it{ tags.with.find(std::string{ variant_name }) }; it != tags.with.end()) {
    return tags.base + "-with-" + it->second;
  }

  throw publish_error::unknown_variant(std::string{ variant_name });
}

std::vector<publish_target> resolve_tags(image_variant const &variant,
                                         tag_convention const &tags,
                                         std::string_view registry,
                                         std::string_view repository) {
  auto tag{ tag_for_variant(variant.name, tags) };
  if (!tag_is_valid(tag)) {
    throw publish_error::config_invalid("variant '" + variant.name +
                                        "' resolves to invalid tag '" + tag + "'");
  }

  return { publish_target{ .registry = std::string{ registry },
                           .repository = std::string{ repository },
                           .tag = std::move(tag) } };
}

std::vector<std::vector<publish_target>> resolve_all_tags(
    std::vector<image_variant> const &variants,
    tag_convention const &tags,
    std::string_view registry,
    std::string_view repository) {
  std::vector<std::vector<publish_target>> out;
  out.reserve(variants.size());
  std::unordered_map<std::string, std::string> owner;  // tag -> variant

  for (auto const &variant : variants) {
    auto targets{ resolve_tags(variant, tags, registry, repository) };
    for (auto const &t : targets) {
      auto const [it, inserted]{ owner.emplace(t.tag, variant.name) };
      if (!inserted && it->second != variant.name) {
        throw publish_error::config_invalid("variants '" + it->second + "' and '" +
                                            variant.name + "' both resolve to tag '" +
                                            t.tag + "'");
      }
    }
    out.push_back(std::move(targets));
  }
  return out;
}

}  // namespace hoist
