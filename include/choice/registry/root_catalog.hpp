#pragma once

#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace choice {

class RegistryCore;

// Process-wide index of registries by root name. Every RegistryCore adds
// itself on construction; registries live until process exit, so the
// catalog holds plain pointers.
class RootCatalog {
 public:
  static auto Instance() -> RootCatalog&;

  RootCatalog(const RootCatalog&) = delete;
  auto operator=(const RootCatalog&) -> RootCatalog& = delete;
  RootCatalog(RootCatalog&&) = delete;
  auto operator=(RootCatalog&&) -> RootCatalog& = delete;

  // Throws std::invalid_argument if another registry uses the same name.
  void Add(RegistryCore& registry);
  void Remove(const RegistryCore& registry);

  [[nodiscard]] auto Find(std::string_view root_name) const -> RegistryCore*;

  // Sorted by root name.
  [[nodiscard]] auto Roots() const -> std::vector<RegistryCore*>;

 private:
  RootCatalog() = default;
  ~RootCatalog() = default;

  mutable std::mutex mutex_;
  std::map<std::string, RegistryCore*, std::less<>> roots_;
};

}  // namespace choice
