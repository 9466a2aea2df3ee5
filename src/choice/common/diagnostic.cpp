#include "choice/common/diagnostic.hpp"

#include <string>

#include <fmt/format.h>

namespace choice {

auto FormatDiagnostic(const Diagnostic& diag) -> std::string {
  std::string out;
  if (diag.mark) {
    out = fmt::format(
        "{}:{}: {}", diag.mark->line + 1, diag.mark->column + 1, diag.message);
  } else {
    out = diag.message;
  }
  for (const auto& note : diag.notes) {
    out += fmt::format("\nnote: {}", note);
  }
  return out;
}

}  // namespace choice
