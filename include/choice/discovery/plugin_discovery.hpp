#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "choice/discovery/module_loader.hpp"

namespace choice::discovery {

// One-shot population of a registry from a plugin package.
//
// The first EnsureDiscovered() imports the package and every immediate
// submodule through the loader, then marks discovery done; later calls
// return immediately. Concurrent first callers block on the mutex instead of
// importing twice. A call made from inside an import on the same thread (a
// plugin querying its own registry) returns without recursing.
//
// Import failures propagate unchanged and leave the discovery undone.
class PluginDiscovery {
 public:
  PluginDiscovery(
      std::string owner_name, std::string package_path,
      std::shared_ptr<ModuleLoader> loader);

  void EnsureDiscovered();

  [[nodiscard]] auto Done() const -> bool {
    return done_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto PackagePath() const -> const std::string& {
    return package_path_;
  }
  // Modules imported by the successful discovery, in import order.
  [[nodiscard]] auto ImportedModules() const -> const std::vector<std::string>&;

 private:
  std::string owner_name_;
  std::string package_path_;
  std::shared_ptr<ModuleLoader> loader_;

  std::atomic<bool> done_{false};
  bool in_progress_ = false;
  std::recursive_mutex mutex_;
  std::vector<std::string> imported_modules_;
};

}  // namespace choice::discovery
