#include "choice/registry/registry_core.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeindex>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "choice/common/diagnostic.hpp"
#include "choice/common/internal_error.hpp"
#include "choice/discovery/plugin_discovery.hpp"
#include "choice/discovery/shared_library_loader.hpp"
#include "choice/registry/pending_registrations.hpp"
#include "choice/registry/root_catalog.hpp"

namespace choice {

auto FormatTagSet(const VariantTable& table) -> std::string {
  std::string out = "{";
  bool first = true;
  for (const auto& [tag, variant] : table) {
    if (!first) {
      out += ",";
    }
    first = false;
    out += fmt::format("\"{}\"", tag);
  }
  out += "}";
  return out;
}

RegistryCore::RegistryCore(
    std::string root_name, std::type_index root_type, RegistryOptions options)
    : root_name_(std::move(root_name)),
      root_type_(root_type),
      options_(std::move(options)) {
  if (const auto* parent = options_.inherit_from;
      parent != nullptr && !options_.discover_packages_path) {
    options_.discover_packages_path = parent->options_.discover_packages_path;
    if (options_.loader == nullptr) {
      options_.loader = parent->options_.loader;
    }
  }
  if (options_.discover_packages_path) {
    if (options_.loader == nullptr) {
      options_.loader = discovery::DefaultSharedLibraryLoader();
    }
    discovery_ = std::make_unique<discovery::PluginDiscovery>(
        root_name_, *options_.discover_packages_path, options_.loader);
  }
  RootCatalog::Instance().Add(*this);
}

RegistryCore::~RegistryCore() {
  RootCatalog::Instance().Remove(*this);
}

auto RegistryCore::RegisterDescriptor(
    std::string tag, std::shared_ptr<const VariantDescriptorBase> variant)
    -> const VariantDescriptorBase& {
  if (variant == nullptr || &variant->Owner() != this) {
    ThrowInternalError(
        "RegistryCore::RegisterDescriptor",
        fmt::format(
            "descriptor for '{}' does not belong to registry {}", tag,
            root_name_));
  }

  auto it = table_.find(tag);
  if (it != table_.end()) {
    if (it->second->Type() != variant->Type()) {
      throw ConflictError(
          fmt::format(
              "cannot register {} as '{}' in {} because {} is already "
              "registered as '{}'",
              variant->TypeName(), tag, root_name_, it->second->TypeName(),
              tag));
    }
    spdlog::trace(
        "choice: '{}' -> {} already registered in {}", tag,
        variant->TypeName(), root_name_);
    return *it->second;
  }

  spdlog::debug(
      "choice: registered '{}' -> {} in {}", tag, variant->TypeName(),
      root_name_);
  auto inserted = table_.emplace(std::move(tag), std::move(variant)).first;
  return *inserted->second;
}

auto RegistryCore::Get(std::string_view tag) -> const VariantDescriptorBase& {
  Discover();
  auto it = table_.find(tag);
  if (it == table_.end()) {
    throw LookupError(fmt::format("unknown tag '{}' in {}", tag, root_name_));
  }
  return *it->second;
}

auto RegistryCore::Known() -> const VariantTable& {
  Discover();
  return table_;
}

auto RegistryCore::NameOf(std::type_index type) const -> const std::string& {
  ApplyPendingRegistrations();
  for (const auto& [tag, variant] : table_) {
    if (variant->Type() == type) {
      return tag;
    }
  }
  throw std::invalid_argument(
      fmt::format(
          "cannot find choice name for {} in {}", DemangledName(type),
          root_name_));
}

auto RegistryCore::FindByType(std::type_index type) const
    -> const VariantDescriptorBase* {
  ApplyPendingRegistrations();
  for (const auto& [tag, variant] : table_) {
    if (variant->Type() == type) {
      return variant.get();
    }
  }
  return nullptr;
}

auto RegistryCore::IsVariant(std::type_index type) -> bool {
  Discover();
  return FindByType(type) != nullptr;
}

auto RegistryCore::KnownTagSet() -> std::string {
  return FormatTagSet(Known());
}

void RegistryCore::Discover() {
  ApplyPendingRegistrations();
  if (discovery_ != nullptr) {
    discovery_->EnsureDiscovered();
  }
}

}  // namespace choice
