#pragma once

#include <concepts>
#include <expected>
#include <memory>
#include <type_traits>
#include <typeindex>
#include <typeinfo>

#include <yaml-cpp/yaml.h>

#include "choice/bridge/stages.hpp"
#include "choice/common/diagnostic.hpp"
#include "choice/common/type_name.hpp"
#include "choice/registry/registry.hpp"
#include "choice/registry/registry_core.hpp"

namespace choice {

// A class that reaches a choice registry through ChoiceRegistry(), either
// declared by CHOICE_ROOT or inherited from its root.
template <typename T>
concept ChoiceType = requires {
  requires std::derived_from<
      std::remove_reference_t<decltype(T::ChoiceRegistry())>, RegistryCore>;
};

template <ChoiceType T>
using RootOf = typename std::remove_reference_t<
    decltype(T::ChoiceRegistry())>::RootType;

// Decodes `input` into T.
//
// Decoding against the root (or any abstract class of the hierarchy) picks
// the variant named by the "type" key, or the root's default tag, and
// decodes the remaining keys into it. Decoding against a concrete variant
// decodes its own fields and rejects a "type" key.
//
// Throws ParsingError for bad input and ImportError when plugin discovery
// fails.
template <ChoiceType T>
auto Decode(const YAML::Node& input) -> std::shared_ptr<T> {
  using Root = RootOf<T>;
  static_assert(
      std::is_base_of_v<Root, T>, "T must belong to its registry's hierarchy");

  auto& registry = T::ChoiceRegistry();
  auto resolution =
      bridge::ResolveDiscriminator(registry, std::type_index(typeid(T)), input);
  const auto& variant =
      static_cast<const VariantDescriptor<Root>&>(*resolution.variant);

  std::shared_ptr<Root> value;
  try {
    value = variant.DecodeFields(resolution.fields);
  } catch (const YAML::Exception& e) {
    bridge::ThrowStructuralError(resolution, e);
  }

  auto typed = std::dynamic_pointer_cast<T>(value);
  if (typed == nullptr) {
    bridge::ThrowNotASubtype(registry, resolution, DemangledName(typeid(T)));
  }
  return typed;
}

// An already constructed instance decodes to itself.
template <ChoiceType T>
auto Decode(std::shared_ptr<T> value) -> std::shared_ptr<T> {
  return value;
}

// Decode() reporting diagnostics instead of throwing them.
template <ChoiceType T>
auto TryDecode(const YAML::Node& input) -> Result<std::shared_ptr<T>> {
  try {
    return Decode<T>(input);
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  }
}

}  // namespace choice
