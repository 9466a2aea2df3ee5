#pragma once

#include <string>
#include <string_view>

#include "choice/common/diagnostic.hpp"

namespace choice::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);

// Prints "file:line:col: error: message" plus notes. `file` may be empty.
void PrintDiagnostic(const Diagnostic& diag, std::string_view file = {});

}  // namespace choice::driver
