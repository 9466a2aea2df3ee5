#include "config.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <toml++/toml.hpp>

#include "choice/common/diagnostic.hpp"

namespace choice::driver {

namespace fs = std::filesystem;

namespace {

constexpr auto kConfigFileName = "choice.toml";

// Reads an optional array of strings, resolving each entry against base.
auto ReadPathList(
    const toml::node_view<const toml::node>& node, std::string_view field,
    const fs::path& config_path, const fs::path& base)
    -> Result<std::vector<std::string>> {
  std::vector<std::string> result;
  if (!node) {
    return result;
  }

  const auto* array = node.as_array();
  if (array == nullptr) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "{}: '{}' must be an array of strings", config_path.string(),
                field)));
  }

  for (const auto& element : *array) {
    auto value = element.value<std::string>();
    if (!value) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "{}: '{}' must be an array of strings",
                  config_path.string(), field)));
    }
    fs::path path(*value);
    if (path.is_relative()) {
      path = base / path;
    }
    result.push_back(path.lexically_normal().string());
  }
  return result;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  ProjectConfig config;
  config.root_dir = fs::absolute(config_path).parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "failed to parse {}: {}", config_path.string(),
                e.description())));
  }

  const toml::table& view = tbl;

  // [plugins] section
  auto search_path = ReadPathList(
      view["plugins"]["search_path"], "plugins.search_path", config_path,
      config.root_dir);
  if (!search_path) {
    return std::unexpected(search_path.error());
  }
  config.search_path = std::move(*search_path);

  auto load = ReadPathList(
      view["plugins"]["load"], "plugins.load", config_path, config.root_dir);
  if (!load) {
    return std::unexpected(load.error());
  }
  config.load = std::move(*load);

  // [check] section
  auto root = view["check"]["root"];
  if (root) {
    auto name = root.value<std::string>();
    if (!name) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "{}: 'check.root' must be a string", config_path.string())));
    }
    config.root = *name;
  }

  return config;
}

}  // namespace choice::driver
