#include "choice/discovery/shared_library_loader.hpp"

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <dlfcn.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "choice/common/diagnostic.hpp"
#include "choice/registry/pending_registrations.hpp"

namespace choice::discovery {

namespace fs = std::filesystem;

namespace {

// "models.plugins" -> "models/plugins"; anything with a '/' is already a path.
auto PackageToRelativePath(std::string_view package) -> fs::path {
  if (package.find('/') != std::string_view::npos) {
    return fs::path(package);
  }
  std::string relative(package);
  std::ranges::replace(relative, '.', '/');
  return fs::path(relative);
}

auto SplitSearchPath(std::string_view value) -> std::vector<fs::path> {
  std::vector<fs::path> result;
  while (!value.empty()) {
    auto sep = value.find(':');
    auto entry = value.substr(0, sep);
    if (!entry.empty()) {
      result.emplace_back(entry);
    }
    if (sep == std::string_view::npos) {
      break;
    }
    value.remove_prefix(sep + 1);
  }
  return result;
}

auto IsSharedLibrary(const fs::directory_entry& entry) -> bool {
  std::error_code ec;
  return entry.is_regular_file(ec) &&
         entry.path().extension() == kSharedLibrarySuffix;
}

}  // namespace

SharedLibraryLoader::SharedLibraryLoader(std::vector<fs::path> roots)
    : extra_roots_(std::move(roots)) {
}

void SharedLibraryLoader::AddSearchRoot(fs::path root) {
  std::lock_guard<std::mutex> lock(mutex_);
  extra_roots_.push_back(std::move(root));
}

auto SharedLibraryLoader::SearchRoots() const -> std::vector<fs::path> {
  std::vector<fs::path> roots;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    roots = extra_roots_;
  }

  // CHOICE_PLUGIN_PATH environment variable
  if (const char* env_path = std::getenv(kPluginPathEnv)) {
    auto env_roots = SplitSearchPath(env_path);
    roots.insert(roots.end(), env_roots.begin(), env_roots.end());
  }

  // Directory of the running executable
  std::error_code ec;
  auto exe_path = fs::read_symlink("/proc/self/exe", ec);
  if (!ec && !exe_path.empty()) {
    roots.push_back(exe_path.parent_path());
  }

  // Current working directory
  auto cwd = fs::current_path(ec);
  if (!ec) {
    roots.push_back(cwd);
  }
  return roots;
}

auto SharedLibraryLoader::FindPackageDirectory(
    std::string_view package, std::vector<std::string>& tried_paths) const
    -> fs::path {
  auto relative = PackageToRelativePath(package);
  std::error_code ec;

  if (relative.is_absolute()) {
    tried_paths.push_back(relative.string());
    return fs::is_directory(relative, ec) ? relative : fs::path{};
  }

  for (const auto& root : SearchRoots()) {
    auto candidate = root / relative;
    tried_paths.push_back(candidate.string());
    if (fs::is_directory(candidate, ec)) {
      return candidate;
    }
  }
  return {};
}

auto SharedLibraryLoader::ImportPackage(std::string_view package)
    -> std::vector<std::string> {
  std::vector<std::string> tried_paths;
  auto directory = FindPackageDirectory(package, tried_paths);
  if (directory.empty()) {
    throw ImportError(
        fmt::format(
            "no plugin package '{}' (tried: {})", package,
            fmt::join(tried_paths, ", ")));
  }

  std::vector<std::string> modules;
  std::error_code ec;
  fs::directory_iterator it(directory, ec);
  if (ec) {
    throw ImportError(
        fmt::format(
            "cannot read plugin package '{}' at {}: {}", package,
            directory.string(), ec.message()));
  }
  for (const auto& entry : it) {
    if (IsSharedLibrary(entry)) {
      modules.push_back(fs::absolute(entry.path()).string());
    }
  }
  std::ranges::sort(modules);
  return modules;
}

void SharedLibraryLoader::ImportModule(std::string_view module) {
  std::string path(module);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (loaded_.contains(path)) {
      return;
    }
    auto failed = failed_.find(path);
    if (failed != failed_.end()) {
      std::rethrow_exception(failed->second);
    }
  }

  // Whatever is still queued belongs to libraries loaded before this one.
  ApplyPendingRegistrations();

  // Clear any stale error before the calls we inspect.
  dlerror();
  void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (handle == nullptr) {
    const char* err = dlerror();
    throw ImportError(
        fmt::format(
            "cannot load plugin module '{}': {}", path,
            err != nullptr ? err : "dlopen failed"));
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::ranges::find(handles_, handle) == handles_.end()) {
      handles_.push_back(handle);
    } else {
      // Reopened after a failed entry point; keep a single reference.
      dlclose(handle);
    }
  }

  // Static registrars ran during dlopen() and only queued their variants.
  // Their initializers never run again, so a failure here is final.
  try {
    ApplyPendingRegistrations();
  } catch (const DiagnosticException&) {
    std::lock_guard<std::mutex> lock(mutex_);
    failed_.emplace(path, std::current_exception());
    throw;
  }

  // The entry point is optional. If it throws, the next import calls it
  // again.
  using EntryFn = void (*)();
  auto* entry = reinterpret_cast<EntryFn>(dlsym(handle, kPluginEntrySymbol));
  if (entry != nullptr) {
    spdlog::debug("choice: running plugin entry of '{}'", path);
    entry();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  loaded_.insert(path);
}

auto SharedLibraryLoader::LoadedLibraries() const -> std::vector<std::string> {
  std::lock_guard<std::mutex> lock(mutex_);
  return {loaded_.begin(), loaded_.end()};
}

auto DefaultSharedLibraryLoader()
    -> const std::shared_ptr<SharedLibraryLoader>& {
  static const auto loader = std::make_shared<SharedLibraryLoader>();
  return loader;
}

}  // namespace choice::discovery
