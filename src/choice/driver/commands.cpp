#include "commands.hpp"

#include <exception>
#include <filesystem>
#include <optional>
#include <string>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "choice/bridge/stages.hpp"
#include "choice/common/diagnostic.hpp"
#include "choice/common/internal_error.hpp"
#include "choice/discovery/shared_library_loader.hpp"
#include "choice/registry/registry_core.hpp"
#include "choice/registry/root_catalog.hpp"
#include "print.hpp"

namespace choice::driver {

namespace fs = std::filesystem;

namespace {

// Makes the search path visible to discovery and loads the libraries that
// define roots. Returns false after printing the failure.
auto LoadPlugins(const DriverInput& input) -> bool {
  const auto& loader = discovery::DefaultSharedLibraryLoader();
  for (const auto& dir : input.search_path) {
    loader->AddSearchRoot(fs::absolute(dir));
  }

  for (const auto& library : input.load) {
    try {
      loader->ImportModule(fs::absolute(library).string());
    } catch (const DiagnosticException& e) {
      PrintDiagnostic(e.GetDiagnostic());
      return false;
    }
  }
  return true;
}

void PrintRoot(RegistryCore& registry) {
  fmt::print("{}\n", registry.RootName());
  if (const auto& tag = registry.DefaultTag()) {
    fmt::print("  default: {}\n", *tag);
  }
  if (const auto& package = registry.Options().discover_packages_path) {
    fmt::print("  discovers: {}\n", *package);
  }

  const auto& known = registry.Known();
  fmt::print("  tags: {}\n", FormatTagSet(known));
  for (const auto& [tag, variant] : known) {
    fmt::print("    {} -> {}\n", tag, variant->TypeName());
  }
}

auto ParseDocument(const std::string& file) -> std::optional<YAML::Node> {
  try {
    return YAML::LoadFile(file);
  } catch (const YAML::BadFile&) {
    PrintError(fmt::format("cannot open '{}'", file));
  } catch (const YAML::ParserException& e) {
    PrintDiagnostic(
        Diagnostic::Parsing(
            SourceMark{.line = e.mark.line, .column = e.mark.column}, e.msg),
        file);
  }
  return std::nullopt;
}

}  // namespace

auto List(const DriverInput& input) -> int {
  if (!LoadPlugins(input)) {
    return 1;
  }

  auto roots = RootCatalog::Instance().Roots();
  if (roots.empty()) {
    PrintWarning("no choice roots loaded (use --load or [plugins] load)");
    return 0;
  }

  for (auto* registry : roots) {
    try {
      PrintRoot(*registry);
    } catch (const DiagnosticException& e) {
      PrintDiagnostic(e.GetDiagnostic());
      return 1;
    }
  }
  return 0;
}

auto Check(const DriverInput& input) -> int {
  if (!input.root) {
    PrintError("no root given (use --root or [check] root)");
    return 1;
  }
  if (!input.file) {
    PrintError("no input file");
    return 1;
  }
  if (!LoadPlugins(input)) {
    return 1;
  }

  auto* registry = RootCatalog::Instance().Find(*input.root);
  if (registry == nullptr) {
    PrintError(fmt::format("unknown choice root '{}'", *input.root));
    return 1;
  }

  auto document = ParseDocument(*input.file);
  if (!document) {
    return 1;
  }

  YAML::Node normalized;
  try {
    normalized = bridge::Normalize(*registry, *document);
  } catch (const DiagnosticException& e) {
    PrintDiagnostic(e.GetDiagnostic(), *input.file);
    return 1;
  } catch (const InternalError& e) {
    PrintError(e.what());
    return 1;
  }

  spdlog::debug("choice: '{}' is a valid {}", *input.file, *input.root);
  YAML::Emitter out;
  out << normalized;
  fmt::print("{}\n", out.c_str());
  return 0;
}

}  // namespace choice::driver
