#include "cli.h"
#include "libcurl_registry.h"
#include "publish_error.h"
#include "tui.h"

#include <cstdio>
#include <variant>

int main(int argc, char **argv) {
  hoist::tui::init();

  auto args{ hoist::cli_parse(argc, argv) };
  hoist::tui::configure_trace_outputs(args.trace_outputs);
  hoist::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (args.help_requested) {
      hoist::tui::print_stdout("%s", args.cli_output.c_str());
      return hoist::exit_status_value(hoist::exit_status::SUCCESS);
    }
    hoist::tui::error("%s", args.cli_output.c_str());
    return hoist::exit_status_value(hoist::exit_status::USAGE);
  }

  if (!args.cmd_cfg.has_value()) {
    return hoist::exit_status_value(hoist::exit_status::USAGE);
  }

  auto cmd{ std::visit([](auto const &cfg) { return hoist::cmd::create(cfg); },
                       *args.cmd_cfg) };

  try {
    hoist::libcurl_ensure_initialized();
    return hoist::exit_status_value(cmd->execute());
  } catch (hoist::publish_error const &ex) {
    hoist::tui::error("%s", ex.what());
    return hoist::exit_status_value(hoist::error_kind_exit_status(ex.kind()));
  } catch (std::exception const &ex) {
    hoist::tui::error("Execution failed: %s", ex.what());
    return hoist::exit_status_value(hoist::exit_status::FAILURE);
  }
}
