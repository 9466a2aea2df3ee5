#include <argparse/argparse.hpp>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "commands.hpp"
#include "config.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

// -v: info, -vv: debug, -vvv: trace. SPDLOG_LEVEL overrides.
void SetupLogging(int verbosity) {
  // All output goes to stderr to keep stdout for documents.
  auto logger = spdlog::stderr_color_mt("choice");
  spdlog::set_default_logger(logger);

  switch (verbosity) {
    case 0:
      spdlog::set_level(spdlog::level::warn);
      break;
    case 1:
      spdlog::set_level(spdlog::level::info);
      break;
    case 2:
      spdlog::set_level(spdlog::level::debug);
      break;
    default:
      spdlog::set_level(spdlog::level::trace);
      break;
  }
  spdlog::cfg::load_env_levels();
}

void AddPluginFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--load")
      .append()
      .help("Library defining choice roots (repeatable)");
  cmd.add_argument("--search-path")
      .append()
      .help("Extra plugin search root (repeatable)");
}

// Leaves `config` empty when no choice.toml is found. Returns false after
// printing the error when one is found but cannot be loaded.
auto LoadOptionalConfig(std::optional<choice::driver::ProjectConfig>& config)
    -> bool {
  auto config_path = choice::driver::FindConfig();
  if (!config_path) {
    return true;
  }
  auto loaded = choice::driver::LoadConfig(*config_path);
  if (!loaded) {
    choice::driver::PrintDiagnostic(loaded.error());
    return false;
  }
  config = std::move(*loaded);
  return true;
}

// Config lists first, CLI entries appended; CLI --root overrides config.
auto BuildInput(
    const argparse::ArgumentParser& cmd,
    const std::optional<choice::driver::ProjectConfig>& config)
    -> choice::driver::DriverInput {
  choice::driver::DriverInput input;

  if (config) {
    input.load = config->load;
    input.search_path = config->search_path;
    input.root = config->root;
  }
  if (auto vals = cmd.present<std::vector<std::string>>("--load")) {
    input.load.insert(input.load.end(), vals->begin(), vals->end());
  }
  if (auto vals = cmd.present<std::vector<std::string>>("--search-path")) {
    input.search_path.insert(
        input.search_path.end(), vals->begin(), vals->end());
  }
  return input;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("choice", "0.1.0");
  program.add_description("Inspect and check choice-type registries");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");

  int verbosity = 0;
  program.add_argument("-v", "--verbose")
      .action([&](const auto&) { ++verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0)
      .help("Increase log verbosity (repeatable)");

  // Subcommand: list
  argparse::ArgumentParser list_cmd("list");
  list_cmd.add_description("List registered roots and their variants");
  AddPluginFlags(list_cmd);

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description(
      "Decode a YAML document against a root and print it normalized");
  check_cmd.add_argument("--root").help(
      "Root name (uses choice.toml if not specified)");
  AddPluginFlags(check_cmd);
  check_cmd.add_argument("file").help("YAML document");

  program.add_subparser(list_cmd);
  program.add_subparser(check_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    choice::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  SetupLogging(verbosity);

  // Handle -C before loading the config
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      choice::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  std::optional<choice::driver::ProjectConfig> config;
  if (program.is_subcommand_used("list") ||
      program.is_subcommand_used("check")) {
    if (!LoadOptionalConfig(config)) {
      return 1;
    }
  }

  if (program.is_subcommand_used("list")) {
    return choice::driver::List(BuildInput(list_cmd, config));
  }

  if (program.is_subcommand_used("check")) {
    auto input = BuildInput(check_cmd, config);
    if (auto root = check_cmd.present<std::string>("--root")) {
      input.root = *root;
    }
    input.file = check_cmd.get<std::string>("file");
    return choice::driver::Check(input);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
