#pragma once

#include <optional>
#include <string>
#include <typeindex>

#include <yaml-cpp/yaml.h>

#include "choice/common/diagnostic.hpp"
#include "choice/registry/registry_core.hpp"
#include "choice/registry/variant_descriptor.hpp"

// The two stages wrapped around yaml-cpp's structural codec. Decode runs
// ResolveDiscriminator, then the resolved variant's YAML::convert decode.
// Encode runs the runtime type's YAML::convert encode, then
// ReattachDiscriminator.
namespace choice::bridge {

struct Resolution {
  // Variant whose structural decode receives `fields`.
  const VariantDescriptorBase* variant = nullptr;
  // Tag that selected the variant (explicit or default). Empty when the
  // target was itself a leaf variant.
  std::optional<std::string> tag;
  // Input without the tag key. The caller's mapping is never modified.
  YAML::Node fields;
  std::optional<SourceMark> mark;
};

// Pre-decode stage. `target` is the static type being decoded:
// - target bound in the registry (leaf): a tag in the input is a
//   ParsingError, the input is passed on unchanged;
// - otherwise (root or intermediate class): the tag, or the default tag,
//   selects the variant and is stripped from the input.
// A null input counts as an empty mapping. Unknown tags, missing tags
// without a default, non-mapping input and non-scalar tags throw
// ParsingError listing the known tags.
auto ResolveDiscriminator(
    RegistryCore& registry, std::type_index target, const YAML::Node& input)
    -> Resolution;

// Post-encode stage. Returns a mapping holding the runtime type's tag under
// kChoiceTypeKey followed by `fields`. A tag already present in `fields` must
// match; a mismatch throws InternalError.
auto ReattachDiscriminator(
    const RegistryCore& registry, std::type_index runtime_type,
    const YAML::Node& fields) -> YAML::Node;

// Decodes `input` against the registry's root and encodes the result again,
// without knowing the root type statically.
auto Normalize(RegistryCore& registry, const YAML::Node& input) -> YAML::Node;

// Reports a yaml-cpp failure inside a variant's structural decode as a
// ParsingError naming the variant.
[[noreturn]] void ThrowStructuralError(
    const Resolution& resolution, const YAML::Exception& error);

// The resolved variant is not a `target_name` (decode through an
// intermediate class picked a variant outside it).
[[noreturn]] void ThrowNotASubtype(
    const RegistryCore& registry, const Resolution& resolution,
    const std::string& target_name);

auto MarkOf(const YAML::Node& node) -> std::optional<SourceMark>;

}  // namespace choice::bridge
