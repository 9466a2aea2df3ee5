#pragma once

#include <exception>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "choice/discovery/module_loader.hpp"

// Marks the optional plugin entry point. A plugin library defines it once:
//
//   CHOICE_PLUGIN_ENTRY {
//     ModelConfig::ChoiceRegistry().Register<GptConfig>("gpt");
//   }
//
// The loader calls it after dlopen() and after applying the library's
// CHOICE_REGISTER_VARIANT registrations, so exceptions thrown while
// registering reach the code that triggered discovery.
#define CHOICE_PLUGIN_ENTRY                                 \
  extern "C" __attribute__((visibility("default"))) void \
  choice_register_plugin()

namespace choice::discovery {

inline constexpr const char* kPluginEntrySymbol = "choice_register_plugin";
inline constexpr const char* kPluginPathEnv = "CHOICE_PLUGIN_PATH";
inline constexpr std::string_view kSharedLibrarySuffix = ".so";

// Loads plugin packages from directories of shared libraries.
//
// A package is a dotted path ("models.plugins" -> "models/plugins") looked up
// under the search roots; a path containing '/' is used as given. Its
// submodules are the shared libraries directly inside that directory.
// Search order:
//   1. Roots added with AddSearchRoot(), in insertion order
//   2. CHOICE_PLUGIN_PATH environment variable (colon separated)
//   3. Directory of the running executable
//   4. Current working directory
//
// Library handles are never closed: registered descriptors point into them.
// A library whose static registrations fail keeps failing with the same
// error on every later import.
class SharedLibraryLoader final : public ModuleLoader {
 public:
  SharedLibraryLoader() = default;
  explicit SharedLibraryLoader(std::vector<std::filesystem::path> roots);
  ~SharedLibraryLoader() override = default;

  SharedLibraryLoader(const SharedLibraryLoader&) = delete;
  auto operator=(const SharedLibraryLoader&) -> SharedLibraryLoader& = delete;
  SharedLibraryLoader(SharedLibraryLoader&&) = delete;
  auto operator=(SharedLibraryLoader&&) -> SharedLibraryLoader& = delete;

  void AddSearchRoot(std::filesystem::path root);

  // Resolves a package to its directory. Returns empty path if not found;
  // populates tried_paths with locations checked.
  auto FindPackageDirectory(
      std::string_view package, std::vector<std::string>& tried_paths) const
      -> std::filesystem::path;

  auto ImportPackage(std::string_view package)
      -> std::vector<std::string> override;
  void ImportModule(std::string_view module) override;

  [[nodiscard]] auto LoadedLibraries() const -> std::vector<std::string>;

 private:
  [[nodiscard]] auto SearchRoots() const -> std::vector<std::filesystem::path>;

  std::vector<std::filesystem::path> extra_roots_;
  mutable std::mutex mutex_;
  std::set<std::string> loaded_;
  std::map<std::string, std::exception_ptr> failed_;
  std::vector<void*> handles_;
};

// Process-wide loader used by registries that do not configure one.
auto DefaultSharedLibraryLoader()
    -> const std::shared_ptr<SharedLibraryLoader>&;

}  // namespace choice::discovery
