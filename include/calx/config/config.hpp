#pragma once

#include "calx/common/result.hpp"
#include "calx/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace calx::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);
[[nodiscard]] common::Status save_config(const Config &config);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

[[nodiscard]] bool is_known_provider(const std::string &provider);

} // namespace calx::config
