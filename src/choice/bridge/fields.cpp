#include "choice/bridge/fields.hpp"

#include <algorithm>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <yaml-cpp/yaml.h>

#include "choice/bridge/stages.hpp"
#include "choice/common/diagnostic.hpp"

namespace choice {

void ValidateKeys(
    const YAML::Node& node, std::initializer_list<std::string_view> allowed,
    std::string_view context) {
  if (!node.IsMap()) {
    return;
  }
  for (const auto& pair : node) {
    auto key = pair.first.as<std::string>();
    bool found = std::ranges::find(allowed, key) != allowed.end();
    if (!found) {
      Diagnostic diag = Diagnostic::Parsing(
          fmt::format(
              "unknown field '{}' in {} (expected one of: {})", key, context,
              fmt::join(allowed, ", ")));
      diag.mark = bridge::MarkOf(pair.first);
      throw ParsingError(std::move(diag));
    }
  }
}

}  // namespace choice
