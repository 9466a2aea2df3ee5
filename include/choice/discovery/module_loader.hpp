#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace choice::discovery {

// Imports plugin packages and their submodules. Importing is expected to
// register variants as a side effect (static registrars or a plugin entry
// point), so a loader never returns anything but module identifiers.
//
// Implementations must:
// - throw ImportError when a package or module cannot be imported,
// - treat a repeated import of the same module as a no-op.
class ModuleLoader {
 public:
  ModuleLoader() = default;
  virtual ~ModuleLoader() = default;

  ModuleLoader(const ModuleLoader&) = delete;
  auto operator=(const ModuleLoader&) -> ModuleLoader& = delete;
  ModuleLoader(ModuleLoader&&) = delete;
  auto operator=(ModuleLoader&&) -> ModuleLoader& = delete;

  // Imports the package itself and returns the identifiers of its immediate
  // (non-recursive) submodules, suitable for ImportModule().
  virtual auto ImportPackage(std::string_view package)
      -> std::vector<std::string> = 0;

  virtual void ImportModule(std::string_view module) = 0;
};

}  // namespace choice::discovery
