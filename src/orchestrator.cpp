#include "orchestrator.h"

#include "trace.h"
#include "tui.h"

#include <tbb/flow_graph.h>
#include <tbb/task_arena.h>
#include <tbb/task_group.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

namespace hoist {

publish_plan make_publish_plan(manifest const &m, std::vector<std::string> const &names) {
  return publish_plan{
    .registry = m.registry,
    .repository = m.repository,
    .variants = m.select_variants(names),
    .tags = m.tags,
    .concurrency = m.concurrency,
    .build = build_settings{ .context = m.context,
                             .dockerfile = m.dockerfile,
                             .timeout = m.build_timeout },
    .publish = publisher_settings{ .login_timeout = m.login_timeout,
                                   .push_timeout = m.push_timeout,
                                   .retry_attempts = m.retry_attempts,
                                   .retry_backoff = m.retry_backoff },
  };
}

namespace {

using node_ptr = std::shared_ptr<tbb::flow::continue_node<tbb::flow::continue_msg>>;

void advance(variant_report &report, publish_state to) {
  if (!publish_state_can_transition(report.state, to)) {
    throw std::runtime_error("variant " + report.name + ": illegal transition " +
                             std::string{ publish_state_name(report.state) } + " -> " +
                             std::string{ publish_state_name(to) });
  }
  report.state = to;
}

// Targets with no recorded result were never published
void mark_unpublished_cancelled(variant_report &report) {
  for (auto const &t : report.targets) {
    bool const has_result{ std::ranges::any_of(report.results, [&](auto const &r) {
      return r.target() == t;
    }) };
    bool const listed{ std::ranges::find(report.cancelled, t) != report.cancelled.end() };
    if (!has_result && !listed) { report.cancelled.push_back(t); }
  }
}

void fail(variant_report &report,
          publish_stage stage,
          error_kind kind,
          std::string message) {
  if (publish_state_is_terminal(report.state)) { return; }
  advance(report, publish_state::FAILED);
  report.failure = variant_failure{ .stage = stage, .kind = kind, .message = std::move(message) };
  if (kind == error_kind::CANCELLED) { mark_unpublished_cancelled(report); }
}

void fail_all(run_summary &summary,
              publish_stage stage,
              error_kind kind,
              std::string const &message) {
  tui::error("%s", message.c_str());
  for (auto &report : summary.variants) { fail(report, stage, kind, message); }
}

// Catch-all for the stage that leaves the variant's current state: publish
// errors carry their kind, and anything else is charged to the stage itself.
template <typename Fn>
void run_stage(variant_report &report, cancellation const &cancel, Fn &&fn) {
  if (report.state == publish_state::FAILED) { return; }
  auto const stage{ publish_stage_leaving(report.state) };

  if (cancel.requested()) {
    fail(report,
         stage,
         error_kind::CANCELLED,
         publish_error::cancelled(stage, report.name).what());
    return;
  }

  try {
    fn();
  } catch (publish_error const &e) {
    if (e.kind() != error_kind::CANCELLED) { tui::error("%s", e.what()); }
    fail(report, stage, e.kind(), e.what());
  } catch (std::exception const &e) {
    tui::error("%s: %s", report.name.c_str(), e.what());
    fail(report,
         stage,
         stage == publish_stage::BUILD ? error_kind::BUILD_FAILED : error_kind::PUSH_FAILED,
         e.what());
  }
}

// Pushes for one variant's targets run concurrently; the publisher serializes
// pushes that share a reference.
void push_targets(variant_report &report,
                  registry_publisher &publisher,
                  session const &s,
                  cancellation const &cancel) {
  auto const &targets{ report.targets };
  std::vector<std::optional<publish_result>> slots(targets.size());

  tbb::task_group group;
  for (size_t i{ 0 }; i < targets.size(); ++i) {
    group.run([&, i] {
      try {
        slots[i] = publisher.push(s, *report.build, targets[i], cancel);
      } catch (publish_error const &e) {
        if (e.kind() != error_kind::CANCELLED) {
          slots[i] = publish_result::failure(targets[i], e.kind(), e.what(), 0);
        }
      } catch (std::exception const &e) {
        slots[i] = publish_result::failure(targets[i], error_kind::PUSH_FAILED, e.what(), 0);
      }
    });
  }
  group.wait();

  bool aborted{ false };
  for (size_t i{ 0 }; i < targets.size(); ++i) {
    if (slots[i]) {
      report.results.push_back(std::move(*slots[i]));
    } else {
      aborted = true;
    }
  }

  if (aborted) { throw publish_error::cancelled(publish_stage::PUSH, report.name); }

  auto const failed{ std::ranges::find_if(report.results,
                                          [](auto const &r) { return !r.succeeded(); }) };
  if (failed != report.results.end()) {
    fail(report, publish_stage::PUSH, *failed->error(), failed->error_message());
    return;
  }

  advance(report, publish_state::PUBLISHED);
}

}  // namespace

orchestrator::orchestrator(build_engine &engine, registry_api &api, cancellation &cancel)
    : engine_{ engine }, api_{ api }, cancel_{ cancel } {}

run_summary orchestrator::run(publish_plan const &plan, credential_resolver const &resolve) {
  run_summary summary;
  for (auto const &v : plan.variants) {
    summary.variants.push_back(variant_report{ .name = v.name, .platforms = v.platforms });
  }
  if (summary.variants.empty()) { return summary; }

  // CONFIGURE: every tag is known before any network activity
  try {
    auto targets{ resolve_all_tags(plan.variants, plan.tags, plan.registry, plan.repository) };
    for (size_t i{ 0 }; i < targets.size(); ++i) {
      summary.variants[i].targets = std::move(targets[i]);
    }
  } catch (publish_error const &e) {
    fail_all(summary, publish_stage::CONFIGURE, e.kind(), e.what());
    return summary;
  }

  std::optional<registry_credential> credential;
  try {
    credential.emplace(resolve());
  } catch (publish_error const &e) {
    fail_all(summary, publish_stage::CREDENTIALS, e.kind(), e.what());
    return summary;
  }

  registry_publisher publisher{ engine_, api_, plan.publish };

  // One shared session for the whole run
  std::optional<session> s;
  if (cancel_.requested()) {
    fail_all(summary,
             publish_stage::LOGIN,
             error_kind::CANCELLED,
             publish_error::cancelled(publish_stage::LOGIN, credential->server).what());
    return summary;
  }
  try {
    s.emplace(publisher.login(*credential, plan.repository, cancel_));
  } catch (publish_error const &e) {
    fail_all(summary, publish_stage::LOGIN, e.kind(), e.what());
    return summary;
  } catch (std::exception const &e) {
    fail_all(summary, publish_stage::LOGIN, error_kind::AUTH_FAILED, e.what());
    return summary;
  }
  for (auto &report : summary.variants) { advance(report, publish_state::AUTHENTICATED); }

  build_invoker builder{ engine_, plan.build };
  cancellation const &cancel{ cancel_ };

  tbb::task_arena arena{ std::max(1, plan.concurrency) };
  arena.execute([&] {
    tbb::flow::graph g;
    tbb::flow::broadcast_node<tbb::flow::continue_msg> kickoff{ g };
    std::vector<node_ptr> nodes;

    for (size_t i{ 0 }; i < plan.variants.size(); ++i) {
      auto &report{ summary.variants[i] };
      auto const &variant{ plan.variants[i] };

      auto build_node{ std::make_shared<tbb::flow::continue_node<tbb::flow::continue_msg>>(
          g,
          [&](tbb::flow::continue_msg const &) {
            run_stage(report, cancel, [&] {
              report.build = builder.build(variant, cancel);
              advance(report, publish_state::BUILT);
            });
          }) };

      auto tag_node{ std::make_shared<tbb::flow::continue_node<tbb::flow::continue_msg>>(
          g,
          [&](tbb::flow::continue_msg const &) {
            run_stage(report, cancel, [&] {
              stage_trace_scope trace{ report.name, publish_stage::TAG };
              for (auto const &t : report.targets) {
                tui::debug("%s -> %s", report.build->local_image.c_str(),
                           t.reference().c_str());
              }
              advance(report, publish_state::TAGGED);
              trace.succeed();
            });
          }) };

      auto push_node{ std::make_shared<tbb::flow::continue_node<tbb::flow::continue_msg>>(
          g,
          [&](tbb::flow::continue_msg const &) {
            run_stage(report, cancel, [&] {
              push_targets(report, publisher, *s, cancel);
            });
          }) };

      auto finalize_node{ std::make_shared<tbb::flow::continue_node<tbb::flow::continue_msg>>(
          g,
          [&](tbb::flow::continue_msg const &) {
            if (report.state != publish_state::PUBLISHED) { return; }
            advance(report, publish_state::DONE);
            tui::info("%s: done", report.name.c_str());
          }) };

      tbb::flow::make_edge(kickoff, *build_node);
      tbb::flow::make_edge(*build_node, *tag_node);
      tbb::flow::make_edge(*tag_node, *push_node);
      tbb::flow::make_edge(*push_node, *finalize_node);

      nodes.insert(nodes.end(), { build_node, tag_node, push_node, finalize_node });
    }

    kickoff.try_put(tbb::flow::continue_msg{});
    g.wait_for_all();
  });

  return summary;
}

}  // namespace hoist
