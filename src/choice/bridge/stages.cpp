#include "choice/bridge/stages.hpp"

#include <optional>
#include <string>
#include <typeindex>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "choice/common/diagnostic.hpp"
#include "choice/common/internal_error.hpp"
#include "choice/common/type_name.hpp"
#include "choice/registry/registry_core.hpp"
#include "choice/registry/variant_descriptor.hpp"

namespace choice::bridge {

namespace {

auto IsTagKey(const YAML::Node& key) -> bool {
  return key.IsScalar() && key.Scalar() == kChoiceTypeKey;
}

auto IsAbsent(const YAML::Node& node) -> bool {
  return !node.IsDefined() || node.IsNull();
}

[[noreturn]] void ThrowParsing(
    std::optional<SourceMark> mark, std::string message) {
  Diagnostic diag = Diagnostic::Parsing(std::move(message));
  diag.mark = mark;
  throw ParsingError(std::move(diag));
}

// The tag carried by `input`, if any. Validates the input shape on the way.
auto ExtractTag(
    RegistryCore& registry, const std::string& target_name,
    const YAML::Node& input) -> std::optional<std::string> {
  if (IsAbsent(input)) {
    return std::nullopt;
  }
  if (!input.IsMap()) {
    ThrowParsing(
        MarkOf(input),
        fmt::format(
            "expected a mapping when decoding {} (a {} choice)", target_name,
            registry.RootName()));
  }

  // "type: ~" counts as no tag.
  const YAML::Node tag_node = input[kChoiceTypeKey];
  if (!tag_node.IsDefined() || tag_node.IsNull()) {
    return std::nullopt;
  }
  if (!tag_node.IsScalar()) {
    ThrowParsing(
        MarkOf(tag_node),
        fmt::format(
            "the '{}' key must be a string naming one of {}", kChoiceTypeKey,
            registry.KnownTagSet()));
  }
  return tag_node.Scalar();
}

auto StripTag(const YAML::Node& input) -> YAML::Node {
  YAML::Node fields(YAML::NodeType::Map);
  if (IsAbsent(input)) {
    return fields;
  }
  for (const auto& entry : input) {
    if (IsTagKey(entry.first)) {
      continue;
    }
    fields[YAML::Clone(entry.first)] = YAML::Clone(entry.second);
  }
  return fields;
}

}  // namespace

auto MarkOf(const YAML::Node& node) -> std::optional<SourceMark> {
  if (!node.IsDefined()) {
    return std::nullopt;
  }
  auto mark = node.Mark();
  if (mark.is_null()) {
    return std::nullopt;
  }
  return SourceMark{.line = mark.line, .column = mark.column};
}

auto ResolveDiscriminator(
    RegistryCore& registry, std::type_index target, const YAML::Node& input)
    -> Resolution {
  std::string target_name = DemangledName(target);
  auto tag = ExtractTag(registry, target_name, input);

  // Already routed past the root: the target is a concrete variant.
  if (registry.IsVariant(target)) {
    const auto* leaf = registry.FindByType(target);
    if (tag) {
      ThrowParsing(
          MarkOf(input[kChoiceTypeKey]),
          fmt::format(
              "unexpected choice key '{}' when decoding leaf type {} (as "
              "opposed to {})",
              *tag, leaf->TypeName(), registry.RootName()));
    }
    return Resolution{
        .variant = leaf,
        .tag = std::nullopt,
        .fields = StripTag(input),
        .mark = MarkOf(input),
    };
  }

  if (!tag) {
    tag = registry.DefaultTag();
  }
  if (!tag) {
    ThrowParsing(
        MarkOf(input),
        fmt::format(
            "expected a '{}' key with a value of one of {} when decoding {}",
            kChoiceTypeKey, registry.KnownTagSet(), target_name));
  }

  const VariantDescriptorBase* variant = nullptr;
  try {
    variant = &registry.Get(*tag);
  } catch (const LookupError&) {
    std::optional<SourceMark> mark;
    if (!IsAbsent(input)) {
      mark = MarkOf(input[kChoiceTypeKey]);
    }
    ThrowParsing(
        mark ? mark : MarkOf(input),
        fmt::format(
            "got choice key '{}' but expected one of {}", *tag,
            registry.KnownTagSet()));
  }

  spdlog::trace(
      "choice: '{}' resolved to {} for {}", *tag, variant->TypeName(),
      target_name);
  return Resolution{
      .variant = variant,
      .tag = tag,
      .fields = StripTag(input),
      .mark = MarkOf(input),
  };
}

auto ReattachDiscriminator(
    const RegistryCore& registry, std::type_index runtime_type,
    const YAML::Node& fields) -> YAML::Node {
  const std::string& tag = registry.NameOf(runtime_type);

  if (!IsAbsent(fields) && !fields.IsMap()) {
    ThrowInternalError(
        "ReattachDiscriminator",
        fmt::format(
            "fields of {} did not encode to a mapping",
            DemangledName(runtime_type)));
  }

  YAML::Node output(YAML::NodeType::Map);
  output[kChoiceTypeKey] = tag;
  if (IsAbsent(fields)) {
    return output;
  }

  for (const auto& entry : fields) {
    if (IsTagKey(entry.first)) {
      if (!entry.second.IsScalar() || entry.second.Scalar() != tag) {
        ThrowInternalError(
            "ReattachDiscriminator",
            fmt::format(
                "expected '{}' under '{}' for {} but got '{}'", tag,
                kChoiceTypeKey, DemangledName(runtime_type),
                YAML::Dump(entry.second)));
      }
      continue;
    }
    output[entry.first] = entry.second;
  }
  return output;
}

auto Normalize(RegistryCore& registry, const YAML::Node& input)
    -> YAML::Node {
  auto resolution = ResolveDiscriminator(registry, registry.RootType(), input);
  YAML::Node fields;
  try {
    fields = resolution.variant->RoundTripFields(resolution.fields);
  } catch (const YAML::Exception& e) {
    ThrowStructuralError(resolution, e);
  }
  return ReattachDiscriminator(registry, resolution.variant->Type(), fields);
}

void ThrowStructuralError(
    const Resolution& resolution, const YAML::Exception& error) {
  std::optional<SourceMark> mark = resolution.mark;
  if (!error.mark.is_null()) {
    mark = SourceMark{.line = error.mark.line, .column = error.mark.column};
  }
  std::string variant_name =
      resolution.tag ? fmt::format(
                           "'{}' ({})", *resolution.tag,
                           resolution.variant->TypeName())
                     : resolution.variant->TypeName();
  ThrowParsing(
      mark, fmt::format("invalid fields for {}: {}", variant_name, error.msg));
}

void ThrowNotASubtype(
    const RegistryCore& registry, const Resolution& resolution,
    const std::string& target_name) {
  ThrowParsing(
      resolution.mark,
      fmt::format(
          "choice key '{}' selects {}, which is not a {} (in {})",
          resolution.tag.value_or(""), resolution.variant->TypeName(),
          target_name, registry.RootName()));
}

}  // namespace choice::bridge
