#pragma once

#include "publish_stage.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace hoist {

namespace trace_events {

struct stage_start {
  std::string subject;  // variant name, target reference or server
  publish_stage stage;
};

struct stage_complete {
  std::string subject;
  publish_stage stage;
  std::int64_t duration_ms;
  bool succeeded;
};

struct process_start {
  std::string subject;
  std::string command;
};

struct process_exit {
  std::string subject;
  int exit_code;
  std::int64_t duration_ms;
  bool timed_out;
  bool cancelled;
};

struct push_attempt {
  std::string target;
  int attempt;
  int max_attempts;
};

struct push_backoff {
  std::string target;
  int attempt;
  std::int64_t delay_ms;
  std::string reason;
};

struct digest_verified {
  std::string target;
  std::string expected;
  std::string actual;
  bool matched;
};

struct http_request {
  std::string method;
  std::string url;
  long status;
  std::int64_t duration_ms;
};

struct cancel_requested {
  std::string source;  // "SIGINT", "SIGTERM", "api"
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::stage_start,
                                   trace_events::stage_complete,
                                   trace_events::process_start,
                                   trace_events::process_exit,
                                   trace_events::push_attempt,
                                   trace_events::push_backoff,
                                   trace_events::digest_verified,
                                   trace_events::http_request,
                                   trace_events::cancel_requested>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

// Emits stage_start on construction and stage_complete on destruction.
// Call succeed() before leaving scope on the success path.
struct stage_trace_scope {
  std::string subject;
  publish_stage stage;
  std::chrono::steady_clock::time_point start;
  bool succeeded{ false };

  stage_trace_scope(std::string subject_value, publish_stage stage_value);
  ~stage_trace_scope();

  void succeed() { succeeded = true; }
};

}  // namespace hoist

#define HOIST_TRACE_UNLIKELY [[unlikely]]

#define HOIST_TRACE_EMIT(event_expr) \
  do { \
    if (::hoist::tui::g_trace_enabled) HOIST_TRACE_UNLIKELY { \
        ::hoist::tui::trace event_expr; \
      } \
  } while (0)

#define HOIST_TRACE_STAGE_START(subject_value, stage_value) \
  HOIST_TRACE_EMIT((::hoist::trace_events::stage_start{ \
      .subject = (subject_value), \
      .stage = (stage_value), \
  }))

#define HOIST_TRACE_STAGE_COMPLETE(subject_value, stage_value, duration_value, ok_value) \
  HOIST_TRACE_EMIT((::hoist::trace_events::stage_complete{ \
      .subject = (subject_value), \
      .stage = (stage_value), \
      .duration_ms = (duration_value), \
      .succeeded = (ok_value), \
  }))

#define HOIST_TRACE_PROCESS_START(subject_value, command_value) \
  HOIST_TRACE_EMIT((::hoist::trace_events::process_start{ \
      .subject = (subject_value), \
      .command = (command_value), \
  }))

#define HOIST_TRACE_PROCESS_EXIT(subject_value, \
                                 exit_code_value, \
                                 duration_value, \
                                 timed_out_value, \
                                 cancelled_value) \
  HOIST_TRACE_EMIT((::hoist::trace_events::process_exit{ \
      .subject = (subject_value), \
      .exit_code = (exit_code_value), \
      .duration_ms = (duration_value), \
      .timed_out = (timed_out_value), \
      .cancelled = (cancelled_value), \
  }))

#define HOIST_TRACE_PUSH_ATTEMPT(target_value, attempt_value, max_value) \
  HOIST_TRACE_EMIT((::hoist::trace_events::push_attempt{ \
      .target = (target_value), \
      .attempt = (attempt_value), \
      .max_attempts = (max_value), \
  }))

#define HOIST_TRACE_PUSH_BACKOFF(target_value, attempt_value, delay_value, reason_value) \
  HOIST_TRACE_EMIT((::hoist::trace_events::push_backoff{ \
      .target = (target_value), \
      .attempt = (attempt_value), \
      .delay_ms = (delay_value), \
      .reason = (reason_value), \
  }))

#define HOIST_TRACE_DIGEST_VERIFIED(target_value, expected_value, actual_value, matched_value) \
  HOIST_TRACE_EMIT((::hoist::trace_events::digest_verified{ \
      .target = (target_value), \
      .expected = (expected_value), \
      .actual = (actual_value), \
      .matched = (matched_value), \
  }))

#define HOIST_TRACE_HTTP_REQUEST(method_value, url_value, status_value, duration_value) \
  HOIST_TRACE_EMIT((::hoist::trace_events::http_request{ \
      .method = (method_value), \
      .url = (url_value), \
      .status = (status_value), \
      .duration_ms = (duration_value), \
  }))

#define HOIST_TRACE_CANCEL_REQUESTED(source_value) \
  HOIST_TRACE_EMIT((::hoist::trace_events::cancel_requested{ \
      .source = (source_value), \
  }))
