#include "cmd_tags.h"

#include "cmd_common.h"
#include "manifest.h"
#include "tag_resolver.h"
#include "tui.h"

#include <CLI/CLI.hpp>

#include <memory>

namespace hoist {

void cmd_tags::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("tags", "Print resolved publish targets (no network)") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--manifest", cfg_ptr->manifest_path, "Path to hoist.lua manifest");
  sub->add_option("--variant", cfg_ptr->variants, "Variant to resolve (repeatable)");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_tags::cmd_tags(cmd_tags::cfg cfg) : cfg_{ std::move(cfg) } {}

exit_status cmd_tags::execute() {
  auto const m{ load_manifest_or_throw(cfg_.manifest_path) };
  auto const variants{ m->select_variants(cfg_.variants) };
  auto const targets{ resolve_all_tags(variants, m->tags, m->registry, m->repository) };

  for (size_t i{ 0 }; i < variants.size(); ++i) {
    for (auto const &t : targets[i]) {
      tui::print_stdout("%s\t%s\n", variants[i].name.c_str(), t.reference().c_str());
    }
  }
  return exit_status::SUCCESS;
}

}  // namespace hoist
