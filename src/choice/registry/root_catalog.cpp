#include "choice/registry/root_catalog.hpp"

#include <mutex>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "choice/registry/pending_registrations.hpp"
#include "choice/registry/registry_core.hpp"

namespace choice {

auto RootCatalog::Instance() -> RootCatalog& {
  static RootCatalog catalog;
  return catalog;
}

void RootCatalog::Add(RegistryCore& registry) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = roots_.emplace(registry.RootName(), &registry);
  if (!inserted && it->second != &registry) {
    throw std::invalid_argument(
        fmt::format(
            "a choice root named '{}' is already defined",
            registry.RootName()));
  }
}

void RootCatalog::Remove(const RegistryCore& registry) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = roots_.find(registry.RootName());
  if (it != roots_.end() && it->second == &registry) {
    roots_.erase(it);
  }
}

auto RootCatalog::Find(std::string_view root_name) const -> RegistryCore* {
  // Queued registrations construct the roots they name.
  ApplyPendingRegistrations();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = roots_.find(root_name);
  return it == roots_.end() ? nullptr : it->second;
}

auto RootCatalog::Roots() const -> std::vector<RegistryCore*> {
  ApplyPendingRegistrations();
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RegistryCore*> result;
  result.reserve(roots_.size());
  for (const auto& [name, registry] : roots_) {
    result.push_back(registry);
  }
  return result;
}

}  // namespace choice
