#include "choice/discovery/plugin_discovery.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "choice/common/internal_error.hpp"

namespace choice::discovery {

namespace {

// Clears the in-progress flag however the import loop exits.
class InProgressScope {
 public:
  explicit InProgressScope(bool& flag) : flag_(flag) {
    flag_ = true;
  }
  ~InProgressScope() {
    flag_ = false;
  }

  InProgressScope(const InProgressScope&) = delete;
  auto operator=(const InProgressScope&) -> InProgressScope& = delete;
  InProgressScope(InProgressScope&&) = delete;
  auto operator=(InProgressScope&&) -> InProgressScope& = delete;

 private:
  bool& flag_;
};

}  // namespace

PluginDiscovery::PluginDiscovery(
    std::string owner_name, std::string package_path,
    std::shared_ptr<ModuleLoader> loader)
    : owner_name_(std::move(owner_name)),
      package_path_(std::move(package_path)),
      loader_(std::move(loader)) {
  if (loader_ == nullptr) {
    ThrowInternalError(
        "PluginDiscovery", "no module loader for '" + owner_name_ + "'");
  }
}

void PluginDiscovery::EnsureDiscovered() {
  if (Done()) {
    return;
  }

  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (Done() || in_progress_) {
    return;
  }
  InProgressScope scope(in_progress_);

  spdlog::debug(
      "choice: discovering plugins for {} from '{}'", owner_name_,
      package_path_);

  std::vector<std::string> imported;
  auto modules = loader_->ImportPackage(package_path_);
  for (const auto& module : modules) {
    loader_->ImportModule(module);
    spdlog::debug("choice: imported module '{}'", module);
    imported.push_back(module);
  }

  imported_modules_ = std::move(imported);
  done_.store(true, std::memory_order_release);
  spdlog::info(
      "choice: {} discovered {} module(s) in '{}'", owner_name_,
      imported_modules_.size(), package_path_);
}

auto PluginDiscovery::ImportedModules() const
    -> const std::vector<std::string>& {
  return imported_modules_;
}

}  // namespace choice::discovery
