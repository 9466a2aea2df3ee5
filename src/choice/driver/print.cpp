#include "print.hpp"

#include <string>
#include <string_view>

#include <fmt/color.h>
#include <fmt/core.h>

#include "choice/common/diagnostic.hpp"

namespace choice::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;
constexpr auto kErrorStyle =
    fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
constexpr auto kNoteStyle =
    fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kConflict:
      return "conflict:";
    case DiagKind::kParsing:
      return "error:";
    case DiagKind::kLookup:
      return "error:";
    case DiagKind::kImport:
      return "import error:";
    case DiagKind::kHostError:
      return "error:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto FormatLocation(const Diagnostic& diag, std::string_view file)
    -> std::string {
  if (!diag.mark) {
    return std::string(file);
  }
  if (file.empty()) {
    return fmt::format("{}:{}", diag.mark->line + 1, diag.mark->column + 1);
  }
  return fmt::format(
      "{}:{}:{}", file, diag.mark->line + 1, diag.mark->column + 1);
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("choice", kToolStyle),
      fmt::styled("error:", kErrorStyle),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintWarning(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("choice", kToolStyle),
      fmt::styled(
          "warning:",
          fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintDiagnostic(const Diagnostic& diag, std::string_view file) {
  std::string location = FormatLocation(diag, file);
  const char* kind_str = DiagKindToString(diag.kind);
  auto kind_style = diag.kind == DiagKind::kNote ? kNoteStyle : kErrorStyle;

  if (!location.empty()) {
    fmt::print(
        stderr, "{}: {} {}\n", fmt::styled(location, fmt::emphasis::bold),
        fmt::styled(kind_str, kind_style),
        fmt::styled(diag.message, fmt::emphasis::bold));
  } else {
    fmt::print(
        stderr, "{}: {} {}\n", fmt::styled("choice", kToolStyle),
        fmt::styled(kind_str, kind_style),
        fmt::styled(diag.message, fmt::emphasis::bold));
  }

  for (const auto& note : diag.notes) {
    fmt::print(
        stderr, "{}: {} {}\n", fmt::styled("choice", kToolStyle),
        fmt::styled("note:", kNoteStyle), note);
  }
}

}  // namespace choice::driver
