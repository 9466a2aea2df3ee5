#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "choice/common/diagnostic.hpp"

namespace choice::driver {

struct ProjectConfig {
  // [plugins] search_path: extra discovery roots, absolute after loading
  std::vector<std::string> search_path;
  // [plugins] load: libraries defining choice roots, absolute after loading
  std::vector<std::string> load;
  // [check] root
  std::optional<std::string> root;

  // Directory where choice.toml was found
  std::filesystem::path root_dir;
};

// Search for choice.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse choice.toml file. Relative paths are resolved against its directory.
// Returns error Diagnostic on parse errors or fields of the wrong type.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

}  // namespace choice::driver
