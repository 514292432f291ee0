#pragma once

#include <string_view>

namespace hoist {

// Orchestrator state machine:
//   IDLE -> AUTHENTICATED -> BUILT -> TAGGED -> PUBLISHED -> DONE
// with FAILED reachable from every non-terminal state.
enum class publish_state : int {
  IDLE = 0,
  AUTHENTICATED = 1,
  BUILT = 2,
  TAGGED = 3,
  PUBLISHED = 4,
  DONE = 5,
  FAILED = 6,
};

// Stage that drives a transition; carried by FAILED to say where a run stopped.
enum class publish_stage : int {
  CONFIGURE = 0,    // manifest validation and tag resolution (pre-network)
  CREDENTIALS = 1,  // credential resolution
  LOGIN = 2,        // IDLE -> AUTHENTICATED
  BUILD = 3,        // AUTHENTICATED -> BUILT
  TAG = 4,          // BUILT -> TAGGED
  PUSH = 5,         // TAGGED -> PUBLISHED
  FINALIZE = 6,     // PUBLISHED -> DONE
};

std::string_view publish_state_name(publish_state s);
std::string_view publish_stage_name(publish_stage s);

bool publish_state_is_terminal(publish_state s);

// True if `to` is the successor of `from`, or `to` is FAILED and `from` is not terminal
bool publish_state_can_transition(publish_state from, publish_state to);

// Stage whose completion moves a variant out of `from` (IDLE -> LOGIN, ...)
publish_stage publish_stage_leaving(publish_state from);

}  // namespace hoist
