#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace hoist {

struct manifest;

// Throws ConfigInvalid if the manifest cannot be found or parsed
std::unique_ptr<manifest> load_manifest_or_throw(
    std::optional<std::filesystem::path> const &manifest_path);

// Replace `path` with `content` via a sibling temp file. Callers pass only
// secret-free text; redactions are applied again on the way out.
void write_report_file(std::filesystem::path const &path, std::string_view content);

// write_report_file that logs failures instead of throwing. Returns false on failure.
bool try_write_report_file(std::filesystem::path const &path, std::string_view content);

}  // namespace hoist
