#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>
#include <utility>

namespace hoist {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm utc_tm{};
  gmtime_r(&timestamp, &utc_tm);

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  util_append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(value ? "true" : "false");
}

void append_stage(std::string &out, publish_stage stage) {
  append_kv(out, "stage", publish_stage_name(stage));
  append_kv(out, "stage_num", static_cast<std::int64_t>(static_cast<int>(stage)));
}

}  // namespace

stage_trace_scope::stage_trace_scope(std::string subject_value, publish_stage stage_value)
    : subject{ std::move(subject_value) },
      stage{ stage_value },
      start{ std::chrono::steady_clock::now() } {
  HOIST_TRACE_STAGE_START(subject, stage);
}

stage_trace_scope::~stage_trace_scope() {
  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };
  HOIST_TRACE_STAGE_COMPLETE(subject,
                             stage,
                             static_cast<std::int64_t>(duration_ms),
                             succeeded);
}

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(match{
                        TRACE_NAME(stage_start),
                        TRACE_NAME(stage_complete),
                        TRACE_NAME(process_start),
                        TRACE_NAME(process_exit),
                        TRACE_NAME(push_attempt),
                        TRACE_NAME(push_backoff),
                        TRACE_NAME(digest_verified),
                        TRACE_NAME(http_request),
                        TRACE_NAME(cancel_requested),
                    },
                    event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::stage_start const &value) {
            std::ostringstream oss;
            oss << "stage_start subject=" << value.subject
                << " stage=" << publish_stage_name(value.stage);
            return oss.str();
          },
          [](trace_events::stage_complete const &value) {
            std::ostringstream oss;
            oss << "stage_complete subject=" << value.subject
                << " stage=" << publish_stage_name(value.stage)
                << " duration_ms=" << value.duration_ms
                << " succeeded=" << bool_string(value.succeeded);
            return oss.str();
          },
          [](trace_events::process_start const &value) {
            std::ostringstream oss;
            oss << "process_start subject=" << value.subject
                << " command=" << value.command;
            return oss.str();
          },
          [](trace_events::process_exit const &value) {
            std::ostringstream oss;
            oss << "process_exit subject=" << value.subject
                << " exit_code=" << value.exit_code
                << " duration_ms=" << value.duration_ms
                << " timed_out=" << bool_string(value.timed_out)
                << " cancelled=" << bool_string(value.cancelled);
            return oss.str();
          },
          [](trace_events::push_attempt const &value) {
            std::ostringstream oss;
            oss << "push_attempt target=" << value.target << " attempt=" << value.attempt
                << "/" << value.max_attempts;
            return oss.str();
          },
          [](trace_events::push_backoff const &value) {
            std::ostringstream oss;
            oss << "push_backoff target=" << value.target << " attempt=" << value.attempt
                << " delay_ms=" << value.delay_ms << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::digest_verified const &value) {
            std::ostringstream oss;
            oss << "digest_verified target=" << value.target
                << " expected=" << value.expected << " actual=" << value.actual
                << " matched=" << bool_string(value.matched);
            return oss.str();
          },
          [](trace_events::http_request const &value) {
            std::ostringstream oss;
            oss << "http_request method=" << value.method << " url=" << value.url
                << " status=" << value.status << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::cancel_requested const &value) {
            return std::string{ "cancel_requested source=" } + value.source;
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  std::visit(
      match{
          [&](trace_events::stage_start const &value) {
            append_kv(output, "subject", value.subject);
            append_stage(output, value.stage);
          },
          [&](trace_events::stage_complete const &value) {
            append_kv(output, "subject", value.subject);
            append_stage(output, value.stage);
            append_kv(output, "duration_ms", value.duration_ms);
            append_kv(output, "succeeded", value.succeeded);
          },
          [&](trace_events::process_start const &value) {
            append_kv(output, "subject", value.subject);
            append_kv(output, "command", value.command);
          },
          [&](trace_events::process_exit const &value) {
            append_kv(output, "subject", value.subject);
            append_kv(output, "exit_code", static_cast<std::int64_t>(value.exit_code));
            append_kv(output, "duration_ms", value.duration_ms);
            append_kv(output, "timed_out", value.timed_out);
            append_kv(output, "cancelled", value.cancelled);
          },
          [&](trace_events::push_attempt const &value) {
            append_kv(output, "target", value.target);
            append_kv(output, "attempt", static_cast<std::int64_t>(value.attempt));
            append_kv(output, "max_attempts", static_cast<std::int64_t>(value.max_attempts));
          },
          [&](trace_events::push_backoff const &value) {
            append_kv(output, "target", value.target);
            append_kv(output, "attempt", static_cast<std::int64_t>(value.attempt));
            append_kv(output, "delay_ms", value.delay_ms);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::digest_verified const &value) {
            append_kv(output, "target", value.target);
            append_kv(output, "expected", value.expected);
            append_kv(output, "actual", value.actual);
            append_kv(output, "matched", value.matched);
          },
          [&](trace_events::http_request const &value) {
            append_kv(output, "method", value.method);
            append_kv(output, "url", value.url);
            append_kv(output, "status", static_cast<std::int64_t>(value.status));
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::cancel_requested const &value) {
            append_kv(output, "source", value.source);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace hoist
