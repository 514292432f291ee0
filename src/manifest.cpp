#include "manifest.h"

#include "sol_util.h"
#include "tui.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>

namespace hoist {

namespace {

constexpr char const *kManifestName{ "hoist.lua" };
constexpr char const *kContext{ "manifest" };

bool is_identifier(std::string_view s) {
  if (s.empty() || std::isdigit(static_cast<unsigned char>(s.front()))) { return false; }
  return std::ranges::all_of(s, [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
  });
}

std::string require_nonempty(sol::table const &table,
                             std::string_view key,
                             std::string_view context) {
  auto value{ sol_util_get_required<std::string>(table, key, context) };
  if (util_trim(value).empty()) {
    throw std::runtime_error(std::string{ context } + ": " + std::string{ key } +
                             " must not be empty");
  }
  return value;
}

long long integer_at_least(sol::table const &table,
                           std::string_view key,
                           long long default_value,
                           long long minimum) {
  auto const value{ sol_util_get_optional_integer(table, key, kContext).value_or(
      default_value) };
  if (value < minimum || value > std::numeric_limits<int>::max()) {
    throw std::runtime_error(std::string{ key } + " must be an integer >= " +
                             std::to_string(minimum));
  }
  return value;
}

std::vector<std::string> parse_platforms(std::vector<std::string> platforms,
                                         std::string const &context) {
  if (platforms.empty()) {
    throw std::runtime_error(context + ": platform set must not be empty");
  }

  std::set<std::string> seen;
  for (auto const &p : platforms) {
    if (!platform_is_valid(p)) {
      throw std::runtime_error(context + ": malformed platform '" + p +
                               "' (expected os/arch[/variant])");
    }
    if (!seen.insert(p).second) {
      throw std::runtime_error(context + ": duplicate platform '" + p + "'");
    }
  }
  return platforms;
}

std::map<std::string, std::string> parse_build_args(sol::table const &variant,
                                                    std::string const &context) {
  std::map<std::string, std::string> args;
  auto const table{ sol_util_get_optional<sol::table>(variant, "build_args", context) };
  if (!table) { return args; }

  for (auto const &[key_obj, value_obj] : *table) {
    if (key_obj.get_type() != sol::type::string) {
      throw std::runtime_error(context + ": build_args keys must be strings");
    }
    auto key{ key_obj.as<std::string>() };
    if (!is_identifier(key)) {
      throw std::runtime_error(context + ": invalid build arg name '" + key + "'");
    }

    switch (value_obj.get_type()) {
      case sol::type::string: args[key] = value_obj.as<std::string>(); break;
      case sol::type::boolean: args[key] = value_obj.as<bool>() ? "true" : "false"; break;
      case sol::type::number: {
        auto const n{ value_obj.as<double>() };
        if (sol_util_is_integral(n)) {
          args[key] = std::to_string(static_cast<long long>(n));
        } else if (std::isfinite(n)) {
          args[key] = std::to_string(n);
        } else {
          throw std::runtime_error(context + ": build_args." + key + " must be finite");
        }
        break;
      }
      default:
        throw std::runtime_error(context + ": build_args." + key +
                                 " must be a string, number or boolean");
    }
  }
  return args;
}

std::vector<image_variant> parse_variants(sol::state &lua,
                                          std::vector<std::string> const &defaults) {
  sol::object const obj{ lua["VARIANTS"] };
  if (!obj.valid() || obj.get_type() != sol::type::table) {
    throw std::runtime_error("VARIANTS must be a non-empty table");
  }

  auto const table{ obj.as<sol::table>() };
  auto const n{ table.size() };
  if (n == 0) { throw std::runtime_error("VARIANTS must be a non-empty table"); }

  std::vector<image_variant> out;
  std::set<std::string> names;
  for (size_t i{ 1 }; i <= n; ++i) {
    std::string const context{ "VARIANTS[" + std::to_string(i) + "]" };
    sol::object const entry{ table[i] };
    if (entry.get_type() != sol::type::table) {
      throw std::runtime_error(context + " must be a table");
    }
    auto const v{ entry.as<sol::table>() };

    image_variant variant;
    variant.name = require_nonempty(v, "name", context);
    if (!names.insert(variant.name).second) {
      throw std::runtime_error("duplicate variant name '" + variant.name + "'");
    }
    variant.build_args = parse_build_args(v, context);
    variant.platforms = parse_platforms(
        sol_util_get_string_array(v, "platforms", context).value_or(defaults),
        context);
    out.push_back(std::move(variant));
  }
  return out;
}

tag_convention parse_tags(sol::state &lua) {
  sol::object const obj{ lua["TAGS"] };
  if (!obj.valid() || obj.get_type() != sol::type::table) {
    throw std::runtime_error("TAGS must be a table");
  }
  auto const t{ obj.as<sol::table>() };

  tag_convention tags;
  tags.base = require_nonempty(t, "base", "TAGS");
  tags.default_variant = require_nonempty(t, "default", "TAGS");

  if (auto const with{ sol_util_get_optional<sol::table>(t, "with", "TAGS") }) {
    for (auto const &[k, v] : *with) {
      if (k.get_type() != sol::type::string || v.get_type() != sol::type::string) {
        throw std::runtime_error("TAGS.with must map variant names to component strings");
      }
      auto component{ v.as<std::string>() };
      if (util_trim(component).empty()) {
        throw std::runtime_error("TAGS.with." + k.as<std::string>() +
                                 " must not be empty");
      }
      tags.with.emplace(k.as<std::string>(), std::move(component));
    }
  }

  if (tags.with.contains(tags.default_variant)) {
    throw std::runtime_error("TAGS.default variant '" + tags.default_variant +
                             "' must not also appear under TAGS.with");
  }
  return tags;
}

std::optional<deployment_cfg> parse_deployment(sol::state &lua) {
  sol::object const obj{ lua["DEPLOYMENT"] };
  if (!obj.valid() || obj.get_type() == sol::type::lua_nil) { return std::nullopt; }
  if (obj.get_type() != sol::type::table) {
    throw std::runtime_error("DEPLOYMENT must be a table");
  }
  auto const t{ obj.as<sol::table>() };

  return deployment_cfg{
    .name = require_nonempty(t, "name", "DEPLOYMENT"),
    .namespace_name = sol_util_get_or_default<std::string>(t,
                                                           "namespace",
                                                           "default",
                                                           "DEPLOYMENT"),
    .container = require_nonempty(t, "container", "DEPLOYMENT"),
    .secret_name = require_nonempty(t, "secret", "DEPLOYMENT"),
  };
}

std::filesystem::path manifest_relative(std::filesystem::path const &base,
                                        std::string const &value) {
  auto p{ (base / value).lexically_normal() };
  if (!p.has_filename() && p.has_parent_path()) { p = p.parent_path(); }
  return p;
}

void populate(manifest &m, sol::state &lua) {
  sol::table const globals{ lua.globals() };

  m.registry = require_nonempty(globals, "REGISTRY", kContext);
  m.repository = require_nonempty(globals, "REPOSITORY", kContext);
  m.platforms = parse_platforms(sol_util_get_string_array(globals, "PLATFORMS", kContext)
                                    .value_or(std::vector<std::string>{ "linux/amd64" }),
                                "PLATFORMS");
  m.variants = parse_variants(lua, m.platforms);
  m.tags = parse_tags(lua);

  m.concurrency = static_cast<int>(integer_at_least(globals, "CONCURRENCY", 2, 1));
  m.push_timeout =
      std::chrono::seconds{ integer_at_least(globals, "PUSH_TIMEOUT_SECONDS", 600, 1) };
  m.build_timeout =
      std::chrono::seconds{ integer_at_least(globals, "BUILD_TIMEOUT_SECONDS", 3600, 1) };
  m.login_timeout =
      std::chrono::seconds{ integer_at_least(globals, "LOGIN_TIMEOUT_SECONDS", 60, 1) };
  m.retry_attempts = static_cast<int>(integer_at_least(globals, "RETRY_ATTEMPTS", 3, 1));
  m.retry_backoff =
      std::chrono::milliseconds{ integer_at_least(globals, "RETRY_BACKOFF_MS", 1000, 0) };

  auto const base_dir{ m.manifest_path.parent_path() };
  m.context = manifest_relative(
      base_dir,
      sol_util_get_or_default<std::string>(globals, "CONTEXT", ".", kContext));
  m.dockerfile = manifest_relative(
      base_dir,
      sol_util_get_or_default<std::string>(globals, "DOCKERFILE", "Dockerfile", kContext));

  if (auto engine{ sol_util_get_string_array(globals, "ENGINE", kContext) }) {
    if (engine->empty() || engine->front().empty()) {
      throw std::runtime_error("ENGINE must name an executable");
    }
    m.engine = std::move(*engine);
  }

  m.deployment = parse_deployment(lua);
}

}  // namespace

bool platform_is_valid(std::string_view platform) {
  auto const parts{ util_split(platform, '/') };
  if (parts.size() < 2 || parts.size() > 3) { return false; }
  return std::ranges::all_of(parts, [](std::string const &part) {
    return !part.empty() && std::ranges::all_of(part, [](char c) {
      auto const uc{ static_cast<unsigned char>(c) };
      return std::islower(uc) || std::isdigit(uc) || c == '_';
    });
  });
}

std::optional<std::filesystem::path> manifest::discover() {
  namespace fs = std::filesystem;

  auto cur{ fs::current_path() };

  for (;;) {
    auto const manifest_path{ cur / kManifestName };
    if (fs::exists(manifest_path)) { return manifest_path; }

    auto const git_path{ cur / ".git" };
    if (fs::exists(git_path) && fs::is_directory(git_path)) { return std::nullopt; }

    auto const parent{ cur.parent_path() };
    if (parent == cur) { return std::nullopt; }

    cur = parent;
  }
}

std::filesystem::path manifest::find_manifest_path(
    std::optional<std::filesystem::path> const &explicit_path) {
  if (explicit_path) {
    auto const path{ std::filesystem::absolute(*explicit_path) };
    if (!std::filesystem::exists(path)) {
      throw publish_error::config_invalid("manifest not found: " + path.string());
    }
    return path;
  }

  if (auto const discovered{ discover() }) { return *discovered; }
  throw publish_error::config_invalid(std::string{ "manifest not found (no " } +
                                      kManifestName + " between here and the repo root)");
}

std::unique_ptr<manifest> manifest::load(std::filesystem::path const &manifest_path) {
  tui::debug("Loading manifest from file: %s", manifest_path.string().c_str());

  std::vector<unsigned char> content;
  try {
    content = util_load_file(manifest_path);
  } catch (std::runtime_error const &e) {
    throw publish_error::config_invalid(e.what());
  }

  std::string const script{ reinterpret_cast<char const *>(content.data()),
                            content.size() };
  return load(script.c_str(), manifest_path);
}

std::unique_ptr<manifest> manifest::load(char const *script,
                                         std::filesystem::path const &manifest_path) {
  auto state{ sol_util_make_lua_state() };

  if (sol::protected_function_result const result{
          state->safe_script(script, sol::script_pass_on_error) };
      !result.valid()) {
    sol::error err = result;
    throw publish_error::config_invalid(std::string("failed to execute manifest: ") +
                                        err.what());
  }

  auto m{ std::make_unique<manifest>() };
  m->manifest_path = std::filesystem::absolute(manifest_path);

  try {
    populate(*m, *state);
  } catch (publish_error const &) {
    throw;
  } catch (std::runtime_error const &e) {
    throw publish_error::config_invalid(e.what());
  }

  tui::debug("Manifest: %zu variant(s) for %s/%s",
             m->variants.size(),
             m->registry.c_str(),
             m->repository.c_str());
  return m;
}

std::vector<image_variant> manifest::select_variants(
    std::vector<std::string> const &names) const {
  if (names.empty()) { return variants; }

  for (auto const &name : names) {
    if (std::ranges::none_of(variants, [&](auto const &v) { return v.name == name; })) {
      throw publish_error::unknown_variant(name);
    }
  }

  std::vector<image_variant> out;
  for (auto const &v : variants) {
    if (std::ranges::find(names, v.name) != names.end()) { out.push_back(v); }
  }
  return out;
}

}  // namespace hoist
