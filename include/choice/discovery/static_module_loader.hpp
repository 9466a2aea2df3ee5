#pragma once

#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "choice/discovery/module_loader.hpp"

namespace choice::discovery {

// In-process module table for builds without dlopen() and for tests.
//
// Modules are dotted names ("models.plugins.gpt") bound to an init function
// that performs the module's registrations. A package exists if it was added
// itself or if any module lives below it. Each init runs at most once; an
// init that throws is not marked imported.
class StaticModuleLoader final : public ModuleLoader {
 public:
  using InitFn = std::function<void()>;

  StaticModuleLoader() = default;
  ~StaticModuleLoader() override = default;

  StaticModuleLoader(const StaticModuleLoader&) = delete;
  auto operator=(const StaticModuleLoader&) -> StaticModuleLoader& = delete;
  StaticModuleLoader(StaticModuleLoader&&) = delete;
  auto operator=(StaticModuleLoader&&) -> StaticModuleLoader& = delete;

  // Throws std::invalid_argument if the name is already taken.
  void Add(std::string module, InitFn init);

  auto ImportPackage(std::string_view package)
      -> std::vector<std::string> override;
  void ImportModule(std::string_view module) override;

  [[nodiscard]] auto IsImported(std::string_view module) const -> bool;

 private:
  void RunInit(const std::string& module);

  std::map<std::string, InitFn, std::less<>> modules_;
  std::set<std::string, std::less<>> imported_;
};

}  // namespace choice::discovery
