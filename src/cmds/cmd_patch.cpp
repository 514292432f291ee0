#include "cmd_patch.h"

#include "cmd_common.h"
#include "credentials.h"
#include "deployment_patcher.h"
#include "manifest.h"
#include "tag_resolver.h"
#include "tui.h"

#include <CLI/CLI.hpp>

#include <memory>

namespace hoist {

void cmd_patch::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("patch",
                                "Render pull secret and deployment patch (not applied)") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--manifest", cfg_ptr->manifest_path, "Path to hoist.lua manifest");
  sub->add_option("--credentials",
                  cfg_ptr->credentials,
                  "Credential source: 'env' or 'file:<path>'")
      ->capture_default_str();
  sub->add_option("--variant", cfg_ptr->variant, "Variant whose image is referenced");
  sub->add_flag("--emit-secret",
                cfg_ptr->emit_secret,
                "Print the pull secret data to stdout instead of a placeholder");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_patch::cmd_patch(cmd_patch::cfg cfg) : cfg_{ std::move(cfg) } {}

exit_status cmd_patch::execute() {
  auto const source{ credential_source::parse(cfg_.credentials) };
  auto const m{ load_manifest_or_throw(cfg_.manifest_path) };
  if (!m->deployment) {
    throw publish_error::config_invalid("patch: manifest has no DEPLOYMENT table");
  }

  auto const name{ cfg_.variant.value_or(m->tags.default_variant) };
  auto const variants{ m->select_variants({ name }) };
  auto const targets{ resolve_tags(variants.front(), m->tags, m->registry, m->repository) };

  auto const credential{ resolve_credentials(source,
                                             m->registry,
                                             credentials_process_env()) };

  auto patch{ build_pull_secret_spec(credential,
                                     m->deployment->secret_name,
                                     m->deployment->namespace_name) };
  patch.deployment_name = m->deployment->name;
  patch.container_name = m->deployment->container;
  patch.image = targets.front();

  if (cfg_.emit_secret) {
    tui::warn("--emit-secret: pull secret data follows on stdout");
    tui::print_stdout_unredacted(render_pull_secret(patch, true));
  } else {
    tui::print_stdout("%s", render_pull_secret(patch, false).c_str());
  }
  tui::print_stdout("---\n%s", render_deployment_fragment(patch, targets.front()).c_str());
  return exit_status::SUCCESS;
}

}  // namespace hoist
