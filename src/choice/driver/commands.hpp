#pragma once

#include <optional>
#include <string>
#include <vector>

namespace choice::driver {

// Command-line flags merged with choice.toml.
struct DriverInput {
  std::vector<std::string> load;
  std::vector<std::string> search_path;
  std::optional<std::string> root;
  std::optional<std::string> file;
};

// Prints every registered root with its default tag, discovery package and
// variants. Triggers discovery for each root.
auto List(const DriverInput& input) -> int;

// Decodes input.file against input.root and prints the normalized document.
auto Check(const DriverInput& input) -> int;

}  // namespace choice::driver
