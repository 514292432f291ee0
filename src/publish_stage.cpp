#include "publish_stage.h"

#include <array>
#include <stdexcept>

namespace hoist {

namespace {

// Order must match publish_state enum in publish_stage.h
constinit std::array<std::string_view, 7> const publish_state_name_table{ {
    "Idle",
    "Authenticated",
    "Built",
    "Tagged",
    "Published",
    "Done",
    "Failed",
} };

// Order must match publish_stage enum in publish_stage.h
constinit std::array<std::string_view, 7> const publish_stage_name_table{ {
    "configure",
    "credentials",
    "login",
    "build",
    "tag",
    "push",
    "finalize",
} };

}  // namespace

std::string_view publish_state_name(publish_state s) {
  auto const idx{ static_cast<std::size_t>(s) };
  if (idx >= publish_state_name_table.size()) { return "unknown"; }
  return publish_state_name_table[idx];
}

std::string_view publish_stage_name(publish_stage s) {
  auto const idx{ static_cast<std::size_t>(s) };
  if (idx >= publish_stage_name_table.size()) { return "unknown"; }
  return publish_stage_name_table[idx];
}

bool publish_state_is_terminal(publish_state s) {
  return s == publish_state::DONE || s == publish_state::FAILED;
}

bool publish_state_can_transition(publish_state from, publish_state to) {
  if (publish_state_is_terminal(from)) { return false; }
  if (to == publish_state::FAILED) { return true; }
  return static_cast<int>(to) == static_cast<int>(from) + 1;
}

publish_stage publish_stage_leaving(publish_state from) {
  switch (from) {
    case publish_state::IDLE: return publish_stage::LOGIN;
    case publish_state::AUTHENTICATED: return publish_stage::BUILD;
    case publish_state::BUILT: return publish_stage::TAG;
    case publish_state::TAGGED: return publish_stage::PUSH;
    case publish_state::PUBLISHED: return publish_stage::FINALIZE;
    case publish_state::DONE:
    case publish_state::FAILED: break;
  }
  throw std::logic_error("publish_stage_leaving: terminal state has no outgoing stage");
}

}  // namespace hoist
