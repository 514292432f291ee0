#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace hoist {

class cmd_publish : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_publish> {
    std::optional<std::filesystem::path> manifest_path;
    std::string credentials{ "env" };
    std::vector<std::string> variants;
    std::optional<std::filesystem::path> summary_file;
    std::optional<std::filesystem::path> deployment_out;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_publish(cfg cfg);

  exit_status execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace hoist
