#include "cmd_publish.h"

#include "cancellation.h"
#include "cmd_common.h"
#include "credentials.h"
#include "deployment_patcher.h"
#include "docker_engine.h"
#include "libcurl_registry.h"
#include "manifest.h"
#include "orchestrator.h"
#include "termination.h"
#include "trace.h"
#include "tui.h"

#include <CLI/CLI.hpp>

#include <csignal>
#include <exception>
#include <memory>
#include <string>

namespace hoist {

void cmd_publish::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("publish", "Build, tag, push and verify every variant") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--manifest", cfg_ptr->manifest_path, "Path to hoist.lua manifest");
  sub->add_option("--credentials",
                  cfg_ptr->credentials,
                  "Credential source: 'env' or 'file:<path>'")
      ->capture_default_str();
  sub->add_option("--variant", cfg_ptr->variants, "Variant to publish (repeatable)");
  sub->add_option("--summary-file",
                  cfg_ptr->summary_file,
                  "Also write the JSON summary to this file");
  sub->add_option("--deployment-out",
                  cfg_ptr->deployment_out,
                  "Write the deployment patch fragment for the default variant's image here");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_publish::cmd_publish(cmd_publish::cfg cfg) : cfg_{ std::move(cfg) } {}

namespace {

// The fragment references the default variant's image, the one `patch` uses
void write_deployment_fragment(manifest const &m,
                               run_summary const &summary,
                               std::filesystem::path const &out) {
  if (!m.deployment) {
    tui::warn("--deployment-out given but the manifest has no DEPLOYMENT table");
    return;
  }

  auto const image{ summary.published_target(m.tags.default_variant) };
  if (!image) {
    tui::warn("default variant %s was not published; not writing %s",
              m.tags.default_variant.c_str(),
              out.string().c_str());
    return;
  }

  // The fragment carries only names and the image reference
  deployment_patch const patch{ .secret_name = m.deployment->secret_name,
                                .namespace_name = m.deployment->namespace_name,
                                .image = *image,
                                .server = m.registry,
                                .docker_config_json = {},
                                .deployment_name = m.deployment->name,
                                .container_name = m.deployment->container };
  std::string fragment;
  try {
    fragment = render_deployment_fragment(patch, *image);
  } catch (std::exception const &e) {
    tui::error("deployment patch not written: %s", e.what());
    return;
  }
  if (try_write_report_file(out, fragment)) {
    tui::info("Wrote deployment patch for %s to %s",
              image->reference().c_str(),
              out.string().c_str());
  }
}

struct termination_guard : unmovable {
  explicit termination_guard(cancellation &cancel) { termination_handler_install(&cancel); }
  ~termination_guard() { termination_handler_install(nullptr); }
};

}  // namespace

exit_status cmd_publish::execute() {
  auto const source{ credential_source::parse(cfg_.credentials) };
  auto const m{ load_manifest_or_throw(cfg_.manifest_path) };
  auto const plan{ make_publish_plan(*m, cfg_.variants) };

  cancellation cancel;
  termination_guard const guard{ cancel };

  docker_engine engine{ m->engine };
  libcurl_registry registry;
  orchestrator orch{ engine, registry, cancel };

  auto const summary{ orch.run(plan, [&] {
    return resolve_credentials(source, m->registry, credentials_process_env());
  }) };

  if (int const sig{ termination_signal_received() }) {
    HOIST_TRACE_CANCEL_REQUESTED(sig == SIGINT ? "SIGINT" : "SIGTERM");
    tui::warn("run cancelled by %s", sig == SIGINT ? "SIGINT" : "SIGTERM");
  }

  for (auto const &v : summary.variants) {
    if (v.state == publish_state::DONE) {
      tui::info("%s", summary_variant_line(v).c_str());
    } else {
      tui::error("%s", summary_variant_line(v).c_str());
    }
  }

  auto const json{ summary_to_json(summary) };
  tui::print_stdout("%s\n", json.c_str());
  // Report files never change the exit code
  if (cfg_.summary_file) { try_write_report_file(*cfg_.summary_file, json + "\n"); }

  if (cfg_.deployment_out && summary.all_done()) {
    write_deployment_fragment(*m, summary, *cfg_.deployment_out);
  }

  return summary.exit_code();
}

}  // namespace hoist
