#pragma once

#include "calsched/common/result.hpp"
#include "calsched/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace calsched::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Reads config_path(). A missing file yields the default config.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> load_config_from_string(const std::string &content,
                                                             const std::string &origin = "<string>");

/// Reads only the [observability] table of config_path(), env overrides
/// applied. Records nothing, so it can run before an observer is installed.
[[nodiscard]] common::Result<ObservabilityConfig> load_observability_config();

/// Warnings only; a config that loaded is always usable.
[[nodiscard]] std::vector<std::string> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace calsched::config
