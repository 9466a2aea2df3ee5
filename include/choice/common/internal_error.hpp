#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace choice {

// A registry or codec invariant was broken, e.g. a variant's YAML::convert
// wrote a discriminator that disagrees with its registration. The data is
// never repaired.
class InternalError : public std::runtime_error {
 public:
  InternalError(std::string context, std::string detail)
      : std::runtime_error(
            fmt::format(
                "choice: inconsistent state in {}: {}", context, detail)),
        context_(std::move(context)),
        detail_(std::move(detail)) {
  }

  [[nodiscard]] auto Context() const -> const std::string& {
    return context_;
  }
  [[nodiscard]] auto Detail() const -> const std::string& {
    return detail_;
  }

 private:
  std::string context_;
  std::string detail_;
};

[[noreturn]] inline void ThrowInternalError(
    std::string context, std::string detail) {
  throw InternalError(std::move(context), std::move(detail));
}

}  // namespace choice
