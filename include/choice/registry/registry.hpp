#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include "choice/registry/pending_registrations.hpp"
#include "choice/registry/registry_core.hpp"
#include "choice/registry/variant_descriptor.hpp"

namespace choice {

template <typename Root>
class Registry;

// Second half of the two-step registration form:
//
//   registry.Register("circle").As<Circle>();
template <typename Root>
class PendingVariant {
 public:
  PendingVariant(Registry<Root>& registry, std::string tag)
      : registry_(&registry), tag_(std::move(tag)) {
  }

  template <typename Variant>
  auto As() && -> const VariantDescriptor<Root>& {
    return registry_->template Register<Variant>(std::move(tag_));
  }

  [[nodiscard]] auto Tag() const -> const std::string& {
    return tag_;
  }

 private:
  Registry<Root>* registry_;
  std::string tag_;
};

// Typed front end of RegistryCore for the hierarchy rooted at Root. Root
// must be polymorphic: encode dispatches on the runtime type.
template <typename Root>
class Registry final : public RegistryCore {
  static_assert(
      std::is_polymorphic_v<Root>,
      "a choice root needs a virtual destructor");

 public:
  using RootType = Root;

  Registry(std::string root_name, RegistryOptions options)
      : RegistryCore(
            std::move(root_name), std::type_index(typeid(Root)),
            std::move(options)) {
  }

  template <typename Variant>
  auto Register(std::string tag) -> const VariantDescriptor<Root>& {
    const auto& bound = RegisterDescriptor(
        std::move(tag), MakeVariantDescriptor<Root, Variant>(*this));
    return static_cast<const VariantDescriptor<Root>&>(bound);
  }

  auto Register(std::string tag) -> PendingVariant<Root> {
    return PendingVariant<Root>(*this, std::move(tag));
  }

  auto Get(std::string_view tag) -> const VariantDescriptor<Root>& {
    return static_cast<const VariantDescriptor<Root>&>(RegistryCore::Get(tag));
  }
};

// Declares the choice registry inside the root class body. Descendants reach
// the same registry through the inherited ChoiceRegistry(); a descendant that
// repeats CHOICE_ROOT starts a fresh one.
//
//   class Shape {
//    public:
//     CHOICE_ROOT(Shape);
//     virtual ~Shape() = default;
//   };
#define CHOICE_ROOT(Root)    \
  using ChoiceRootType = Root; \
  static auto ChoiceRegistry() -> ::choice::Registry<Root>&

// Defines the registry in exactly one source file. Optional arguments are
// designated initializers of choice::RegistryOptions:
//
//   CHOICE_DEFINE_ROOT(ModelConfig, .default_tag = "mlp",
//                      .discover_packages_path = "models.plugins");
//
// A descendant root picks up its parent's plugin package with
// .inherit_from = &Parent::ChoiceRegistry().
#define CHOICE_DEFINE_ROOT(Root, ...)                            \
  auto Root::ChoiceRegistry() -> ::choice::Registry<Root>& {     \
    static ::choice::Registry<Root> registry(                    \
        #Root, ::choice::RegistryOptions{__VA_ARGS__});          \
    return registry;                                             \
  }

#define CHOICE_INTERNAL_CONCAT_IMPL(a, b) a##b
#define CHOICE_INTERNAL_CONCAT(a, b) CHOICE_INTERNAL_CONCAT_IMPL(a, b)

// Registers Variant under tag in the registry reached through Owner (the
// root or any class inheriting its registry) when the enclosing library is
// loaded. Use at namespace scope in a source file. A descendant that starts
// its own root still registers in its parent by naming the parent as Owner.
//
//   CHOICE_REGISTER_VARIANT(Shape, "circle", Circle);
//
// The registration is queued (see pending_registrations.hpp) and applied by
// the loader or the next lookup, so a conflict is reported there.
#define CHOICE_REGISTER_VARIANT(Owner, tag, Variant)                 \
  namespace {                                                        \
  [[maybe_unused]] const bool CHOICE_INTERNAL_CONCAT(                \
      choice_registered_, __LINE__) = ::choice::QueueRegistration(   \
      [] { Owner::ChoiceRegistry().Register<Variant>(tag); });        \
  }

}  // namespace choice
