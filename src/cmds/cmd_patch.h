#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace hoist {

// Renders the pull secret and deployment fragment for review. Never applies
// anything to a cluster and never writes the secret to disk.
class cmd_patch : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_patch> {
    std::optional<std::filesystem::path> manifest_path;
    std::string credentials{ "env" };
    std::optional<std::string> variant;  // TAGS.default when absent
    bool emit_secret{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_patch(cfg cfg);

  exit_status execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace hoist
