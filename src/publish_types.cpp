#include "publish_types.h"

#include "util.h"

#include <algorithm>
#include <utility>

namespace hoist {

std::string publish_target::reference() const {
  return registry + "/" + repository + ":" + tag;
}

publish_result::publish_result(publish_target target,
                               std::string digest,
                               bool succeeded,
                               std::optional<error_kind> error,
                               std::string error_message,
                               int attempts)
    : target_{ std::move(target) },
      digest_{ std::move(digest) },
      succeeded_{ succeeded },
      error_{ error },
      error_message_{ std::move(error_message) },
      attempts_{ attempts } {}

publish_result publish_result::success(publish_target target,
                                       std::string digest,
                                       int attempts) {
  return publish_result{ std::move(target), std::move(digest), true, std::nullopt, {},
                         attempts };
}

publish_result publish_result::failure(publish_target target,
                                       error_kind kind,
                                       std::string message,
                                       int attempts,
                                       std::string digest) {
  return publish_result{ std::move(target), std::move(digest), false, kind,
                         std::move(message), attempts };
}

bool run_summary::all_done() const {
  return !variants.empty() && std::ranges::all_of(variants, [](auto const &v) {
    return v.state == publish_state::DONE;
  });
}

std::vector<publish_target> run_summary::published() const {
  std::vector<publish_target> out;
  for (auto const &v : variants) {
    for (auto const &r : v.results) {
      if (r.succeeded()) { out.push_back(r.target()); }
    }
  }
  return out;
}

std::optional<publish_target> run_summary::published_target(std::string_view variant) const {
  for (auto const &v : variants) {
    if (v.name != variant) { continue; }
    for (auto const &r : v.results) {
      if (r.succeeded()) { return r.target(); }
    }
  }
  return std::nullopt;
}

std::vector<publish_target> run_summary::cancelled() const {
  std::vector<publish_target> out;
  for (auto const &v : variants) {
    out.insert(out.end(), v.cancelled.begin(), v.cancelled.end());
  }
  return out;
}

std::optional<variant_failure> run_summary::decisive_failure() const {
  std::optional<variant_failure> best;
  for (auto const &v : variants) {
    if (!v.failure) { continue; }
    auto const &f{ *v.failure };
    if (f.kind == error_kind::CANCELLED) { return f; }
    if (!best || static_cast<int>(f.stage) < static_cast<int>(best->stage)) { best = f; }
  }
  return best;
}

exit_status run_summary::exit_code() const {
  if (auto const failure{ decisive_failure() }) {
    return error_kind_exit_status(failure->kind);
  }
  return all_done() ? exit_status::SUCCESS : exit_status::FAILURE;
}

namespace {

void append_quoted(std::string &out, std::string_view value) {
  out.push_back('"');
  util_append_json_string(out, value);
  out.push_back('"');
}

void append_reference_array(std::string &out, std::vector<publish_target> const &targets) {
  out.push_back('[');
  for (size_t i{ 0 }; i < targets.size(); ++i) {
    if (i) { out.push_back(','); }
    append_quoted(out, targets[i].reference());
  }
  out.push_back(']');
}

void append_result(std::string &out, publish_result const &r) {
  out.append("{\"reference\":");
  append_quoted(out, r.target().reference());
  out.append(",\"digest\":");
  append_quoted(out, r.digest());
  out.append(",\"succeeded\":");
  out.append(r.succeeded() ? "true" : "false");
  out.append(",\"attempts\":");
  out.append(std::to_string(r.attempts()));
  out.append(",\"error\":");
  if (auto const kind{ r.error() }) {
    out.append("{\"kind\":");
    append_quoted(out, error_kind_name(*kind));
    out.append(",\"message\":");
    append_quoted(out, r.error_message());
    out.push_back('}');
  } else {
    out.append("null");
  }
  out.push_back('}');
}

void append_variant(std::string &out, variant_report const &v) {
  out.append("{\"name\":");
  append_quoted(out, v.name);
  out.append(",\"state\":");
  append_quoted(out, publish_state_name(v.state));
  out.append(",\"failed_stage\":");
  if (v.failure) {
    append_quoted(out, publish_stage_name(v.failure->stage));
  } else {
    out.append("null");
  }

  out.append(",\"platforms\":[");
  for (size_t i{ 0 }; i < v.platforms.size(); ++i) {
    if (i) { out.push_back(','); }
    append_quoted(out, v.platforms[i]);
  }
  out.push_back(']');

  out.append(",\"build_digest\":");
  if (v.build) {
    append_quoted(out, v.build->digest);
  } else {
    out.append("null");
  }

  out.append(",\"error\":");
  if (v.failure) {
    out.append("{\"kind\":");
    append_quoted(out, error_kind_name(v.failure->kind));
    out.append(",\"message\":");
    append_quoted(out, v.failure->message);
    out.push_back('}');
  } else {
    out.append("null");
  }

  out.append(",\"targets\":[");
  for (size_t i{ 0 }; i < v.results.size(); ++i) {
    if (i) { out.push_back(','); }
    append_result(out, v.results[i]);
  }
  out.append("],\"cancelled\":");
  append_reference_array(out, v.cancelled);
  out.push_back('}');
}

}  // namespace

std::string summary_to_json(run_summary const &summary) {
  auto const failure{ summary.decisive_failure() };

  std::string out;
  out.reserve(512);
  out.append("{\"state\":");
  append_quoted(out,
                publish_state_name(summary.all_done() ? publish_state::DONE
                                                      : publish_state::FAILED));
  out.append(",\"failed_stage\":");
  if (failure) {
    append_quoted(out, publish_stage_name(failure->stage));
  } else {
    out.append("null");
  }
  out.append(",\"exit_code\":");
  out.append(std::to_string(exit_status_value(summary.exit_code())));
  out.append(",\"published\":");
  append_reference_array(out, summary.published());
  out.append(",\"cancelled\":");
  append_reference_array(out, summary.cancelled());
  out.append(",\"variants\":[");
  for (size_t i{ 0 }; i < summary.variants.size(); ++i) {
    if (i) { out.push_back(','); }
    append_variant(out, summary.variants[i]);
  }
  out.append("]}");
  return out;
}

std::string summary_variant_line(variant_report const &report) {
  std::string line{ report.name };
  line.append(": ");

  if (!report.failure) {
    line.append(publish_state_name(report.state));
    for (auto const &r : report.results) {
      line.append(" ");
      line.append(r.target().reference());
      if (!r.digest().empty()) {
        line.append("@");
        line.append(r.digest());
      }
    }
    return line;
  }

  line.append("Failed(");
  line.append(publish_stage_name(report.failure->stage));
  line.append(") ");
  line.append(error_kind_name(report.failure->kind));

  // First line only; the full message is in the JSON summary
  std::string_view const message{ report.failure->message };
  line.append(": ");
  line.append(message.substr(0, message.find('\n')));
  return line;
}

}  // namespace hoist
