#pragma once

#include "cmds/cmd_patch.h"
#include "cmds/cmd_publish.h"
#include "cmds/cmd_tags.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hoist {

struct cli_args {
  using cmd_cfg_t =
      std::variant<cmd_publish::cfg, cmd_tags::cfg, cmd_patch::cfg, cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;
  bool help_requested{ false };
};

cli_args cli_parse(int argc, char **argv);

}  // namespace hoist
