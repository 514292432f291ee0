#include "sol_util.h"

#include <cmath>

namespace hoist {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base, sol::lib::string, sol::lib::table, sol::lib::math);

  for (char const *name : { "dofile", "loadfile", "load", "collectgarbage" }) {
    (*lua)[name] = sol::lua_nil;
  }

  return lua;
}

bool sol_util_is_integral(double value) {
  constexpr double kLongLongLimit{ 9223372036854775808.0 };  // 2^63
  if (!std::isfinite(value) || value < -kLongLongLimit || value >= kLongLongLimit) {
    return false;
  }
  double integral{ 0 };
  return std::modf(value, &integral) == 0.0;
}

std::optional<long long> sol_util_get_optional_integer(sol::table const &table,
                                                       std::string_view key,
                                                       std::string_view context) {
  auto const value{ sol_util_get_optional<double>(table, key, context) };
  if (!value) { return std::nullopt; }

  if (!sol_util_is_integral(*value)) {
    throw std::runtime_error(std::string(context) + ": " + std::string(key) +
                             " must be an integer");
  }
  return static_cast<long long>(*value);
}

std::optional<std::vector<std::string>> sol_util_get_string_array(
    sol::table const &table,
    std::string_view key,
    std::string_view context) {
  auto const array{ sol_util_get_optional<sol::table>(table, key, context) };
  if (!array) { return std::nullopt; }

  std::vector<std::string> out;
  auto const n{ array->size() };
  out.reserve(n);
  for (size_t i{ 1 }; i <= n; ++i) {
    sol::object const item{ (*array)[i] };
    if (item.get_type() != sol::type::string) {
      throw std::runtime_error(std::string(context) + ": " + std::string(key) + "[" +
                               std::to_string(i) + "] must be a string");
    }
    out.push_back(item.as<std::string>());
  }
  return out;
}

}  // namespace hoist
