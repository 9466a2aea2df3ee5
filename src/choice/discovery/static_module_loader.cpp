#include "choice/discovery/static_module_loader.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "choice/common/diagnostic.hpp"

namespace choice::discovery {

void StaticModuleLoader::Add(std::string module, InitFn init) {
  if (modules_.contains(module)) {
    throw std::invalid_argument(
        fmt::format("module '{}' is already defined", module));
  }
  modules_.emplace(std::move(module), std::move(init));
}

auto StaticModuleLoader::ImportPackage(std::string_view package)
    -> std::vector<std::string> {
  std::string prefix = fmt::format("{}.", package);
  bool exists = modules_.contains(package);

  std::vector<std::string> children;
  for (const auto& [name, init] : modules_) {
    if (!name.starts_with(prefix)) {
      continue;
    }
    exists = true;
    std::string_view rest = std::string_view(name).substr(prefix.size());
    // Only immediate submodules; deeper ones belong to a subpackage.
    if (!rest.empty() && rest.find('.') == std::string_view::npos) {
      children.push_back(name);
    }
  }

  if (!exists) {
    throw ImportError(fmt::format("no module named '{}'", package));
  }
  if (modules_.contains(package)) {
    RunInit(std::string(package));
  }
  return children;
}

void StaticModuleLoader::ImportModule(std::string_view module) {
  if (!modules_.contains(module)) {
    throw ImportError(fmt::format("no module named '{}'", module));
  }
  RunInit(std::string(module));
}

auto StaticModuleLoader::IsImported(std::string_view module) const -> bool {
  return imported_.contains(module);
}

void StaticModuleLoader::RunInit(const std::string& module) {
  if (imported_.contains(module)) {
    return;
  }
  auto it = modules_.find(module);
  if (it->second) {
    it->second();
  }
  imported_.insert(module);
}

}  // namespace choice::discovery
