#pragma once

#include "trace.h"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#if defined(__clang__) || defined(__GNUC__)
#define HOIST_TUI_PRINTF(idx, first) __attribute__((format(printf, idx, first)))
#else
#define HOIST_TUI_PRINTF(idx, first)
#endif

namespace hoist::tui {

enum class level { TUI_TRACE, TUI_DEBUG, TUI_INFO, TUI_WARN, TUI_ERROR };

enum class trace_output_type { std_err, file };

struct trace_output_spec {
  trace_output_type type;
  std::optional<std::filesystem::path> file_path;
};

void init();
void configure_trace_outputs(std::vector<trace_output_spec> outputs);
void set_output_handler(std::function<void(std::string_view)> handler);
void run(std::optional<level> threshold = std::nullopt, bool decorated_logging = false);
void shutdown();

extern bool g_trace_enabled;

void trace(trace_event_t event);
void debug(char const *fmt, ...) HOIST_TUI_PRINTF(1, 2);
void info(char const *fmt, ...) HOIST_TUI_PRINTF(1, 2);
void warn(char const *fmt, ...) HOIST_TUI_PRINTF(1, 2);
void error(char const *fmt, ...) HOIST_TUI_PRINTF(1, 2);

void print_stdout(char const *fmt, ...) HOIST_TUI_PRINTF(1, 2);
// Bypasses redaction; only for output the operator explicitly asked to see.
void print_stdout_unredacted(std::string_view text);

inline constexpr std::size_t kMinRedactionLength{ 4 };

// Every later log line, trace event and print_stdout call has occurrences of
// `value` replaced by "***". Values shorter than kMinRedactionLength are
// ignored; credential resolution rejects tokens that short.
void redact(std::string_view value);
void clear_redactions();
std::string apply_redactions(std::string text);

struct scope {  // raii helper
  explicit scope(std::optional<level> threshold, bool decorated_logging);
  ~scope();

 private:
  bool active{ false };
};

}  // namespace hoist::tui

#undef HOIST_TUI_PRINTF
