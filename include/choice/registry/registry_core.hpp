#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>

#include "choice/discovery/module_loader.hpp"
#include "choice/discovery/plugin_discovery.hpp"
#include "choice/registry/variant_descriptor.hpp"

namespace choice {

// Name of the payload key that carries the discriminator.
inline constexpr const char* kChoiceTypeKey = "type";

using VariantTable = std::map<
    std::string, std::shared_ptr<const VariantDescriptorBase>, std::less<>>;

class RegistryCore;

struct RegistryOptions {
  // Tag used when the input has none.
  std::optional<std::string> default_tag;
  // Dotted package whose submodules register variants on first lookup.
  std::optional<std::string> discover_packages_path;
  // Loader for discover_packages_path; DefaultSharedLibraryLoader() if unset.
  std::shared_ptr<discovery::ModuleLoader> loader;
  // Registry of the enclosing root for a descendant that starts its own.
  // Supplies discover_packages_path and loader when they are left unset.
  const RegistryCore* inherit_from = nullptr;
};

// Formats tags as {"a","b"} for diagnostics.
auto FormatTagSet(const VariantTable& table) -> std::string;

// Per-root table {tag -> variant}. Append-only: once bound, a tag never
// rebinds and nothing is removed.
//
// Every lookup first applies queued static registrations. Get(), Known() and
// IsVariant() also run plugin discovery when the root configures a package;
// NameOf() and FindByType() never do.
class RegistryCore {
 public:
  RegistryCore(
      std::string root_name, std::type_index root_type,
      RegistryOptions options);
  virtual ~RegistryCore();

  RegistryCore(const RegistryCore&) = delete;
  auto operator=(const RegistryCore&) -> RegistryCore& = delete;
  RegistryCore(RegistryCore&&) = delete;
  auto operator=(RegistryCore&&) -> RegistryCore& = delete;

  // Throws LookupError if the tag is unknown after discovery.
  auto Get(std::string_view tag) -> const VariantDescriptorBase&;

  auto Known() -> const VariantTable&;

  // Throws std::invalid_argument if type was never bound here.
  [[nodiscard]] auto NameOf(std::type_index type) const -> const std::string&;

  [[nodiscard]] auto FindByType(std::type_index type) const
      -> const VariantDescriptorBase*;

  auto IsVariant(std::type_index type) -> bool;

  // Known tags formatted with FormatTagSet().
  auto KnownTagSet() -> std::string;

  [[nodiscard]] auto DefaultTag() const -> const std::optional<std::string>& {
    return options_.default_tag;
  }
  [[nodiscard]] auto RootName() const -> const std::string& {
    return root_name_;
  }
  [[nodiscard]] auto RootType() const -> std::type_index {
    return root_type_;
  }
  [[nodiscard]] auto Options() const -> const RegistryOptions& {
    return options_;
  }
  // nullptr when the root configures no package.
  [[nodiscard]] auto Discovery() const -> const discovery::PluginDiscovery* {
    return discovery_.get();
  }
  [[nodiscard]] auto Discovered() const -> bool {
    return discovery_ == nullptr || discovery_->Done();
  }

 protected:
  // Binds tag -> variant and returns the bound descriptor. Binding the same
  // type again returns the existing descriptor; binding another type throws
  // ConflictError.
  auto RegisterDescriptor(
      std::string tag, std::shared_ptr<const VariantDescriptorBase> variant)
      -> const VariantDescriptorBase&;

 private:
  void Discover();

  std::string root_name_;
  std::type_index root_type_;
  RegistryOptions options_;
  VariantTable table_;
  std::unique_ptr<discovery::PluginDiscovery> discovery_;
};

}  // namespace choice
