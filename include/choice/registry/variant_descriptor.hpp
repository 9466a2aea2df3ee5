#pragma once

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "choice/common/type_name.hpp"

namespace choice {

class RegistryCore;

// One concrete variant as seen by its registry: type identity plus the
// structural codec of the variant's own fields. Holds a back-reference to
// the registry that owns it.
class VariantDescriptorBase {
 public:
  VariantDescriptorBase(
      std::type_index type, std::string type_name, RegistryCore& owner)
      : type_(type), type_name_(std::move(type_name)), owner_(&owner) {
  }
  virtual ~VariantDescriptorBase() = default;

  VariantDescriptorBase(const VariantDescriptorBase&) = delete;
  auto operator=(const VariantDescriptorBase&)
      -> VariantDescriptorBase& = delete;
  VariantDescriptorBase(VariantDescriptorBase&&) = delete;
  auto operator=(VariantDescriptorBase&&) -> VariantDescriptorBase& = delete;

  [[nodiscard]] auto Type() const -> std::type_index {
    return type_;
  }
  [[nodiscard]] auto TypeName() const -> const std::string& {
    return type_name_;
  }
  [[nodiscard]] auto Owner() const -> RegistryCore& {
    return *owner_;
  }

  // Decodes the tag-less fields into the variant and encodes the result back
  // into fields. Lets tools normalize documents without knowing the root.
  [[nodiscard]] virtual auto RoundTripFields(const YAML::Node& fields) const
      -> YAML::Node = 0;

 private:
  std::type_index type_;
  std::string type_name_;
  RegistryCore* owner_;
};

template <typename Root>
class VariantDescriptor final : public VariantDescriptorBase {
 public:
  using DecodeFn = std::function<std::shared_ptr<Root>(const YAML::Node&)>;
  using EncodeFn = std::function<YAML::Node(const Root&)>;

  VariantDescriptor(
      std::type_index type, std::string type_name, RegistryCore& owner,
      DecodeFn decode, EncodeFn encode)
      : VariantDescriptorBase(type, std::move(type_name), owner),
        decode_(std::move(decode)),
        encode_(std::move(encode)) {
  }

  // Structural decode of the variant's own fields (tag already removed).
  [[nodiscard]] auto DecodeFields(const YAML::Node& fields) const
      -> std::shared_ptr<Root> {
    return decode_(fields);
  }

  // Structural encode of the variant's own fields (no tag).
  [[nodiscard]] auto EncodeFields(const Root& value) const -> YAML::Node {
    return encode_(value);
  }

  [[nodiscard]] auto RoundTripFields(const YAML::Node& fields) const
      -> YAML::Node override {
    auto value = decode_(fields);
    return encode_(*value);
  }

 private:
  DecodeFn decode_;
  EncodeFn encode_;
};

// Builds the descriptor of Variant, whose fields go through yaml-cpp's
// YAML::convert<Variant>.
template <typename Root, typename Variant>
auto MakeVariantDescriptor(RegistryCore& owner)
    -> std::shared_ptr<const VariantDescriptor<Root>> {
  static_assert(
      std::is_base_of_v<Root, Variant>,
      "a variant must derive from the root of its registry");
  static_assert(
      !std::is_abstract_v<Variant>, "a variant must be a concrete type");

  return std::make_shared<const VariantDescriptor<Root>>(
      std::type_index(typeid(Variant)), DemangledName(typeid(Variant)), owner,
      [](const YAML::Node& fields) -> std::shared_ptr<Root> {
        return std::make_shared<Variant>(fields.as<Variant>());
      },
      [](const Root& value) -> YAML::Node {
        return YAML::Node(static_cast<const Variant&>(value));
      });
}

}  // namespace choice
