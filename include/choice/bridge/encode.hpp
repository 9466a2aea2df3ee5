#pragma once

#include <stdexcept>
#include <typeindex>
#include <typeinfo>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "choice/bridge/decode.hpp"
#include "choice/bridge/stages.hpp"
#include "choice/common/type_name.hpp"
#include "choice/registry/registry.hpp"

namespace choice {

// Encodes `value` through its runtime type's YAML::convert and puts the
// matching tag under "type" as the first key. Throws std::invalid_argument
// if the runtime type is not registered.
template <ChoiceType T>
auto Encode(const T& value) -> YAML::Node {
  using Root = RootOf<T>;

  auto& registry = T::ChoiceRegistry();
  std::type_index runtime_type(typeid(value));
  const auto* found = registry.FindByType(runtime_type);
  if (found == nullptr) {
    throw std::invalid_argument(
        fmt::format(
            "cannot find choice name for {} in {}",
            DemangledName(runtime_type), registry.RootName()));
  }
  const auto& variant = static_cast<const VariantDescriptor<Root>&>(*found);

  YAML::Node fields = variant.EncodeFields(value);
  return bridge::ReattachDiscriminator(registry, runtime_type, fields);
}

}  // namespace choice
