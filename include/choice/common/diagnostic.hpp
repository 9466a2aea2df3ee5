#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace choice {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kConflict,   // Same tag bound to two different types
  kParsing,    // Malformed or unresolvable input (user-facing)
  kLookup,     // Raw registry miss (internal, translated to kParsing)
  kImport,     // Plugin package or module failed to load
  kHostError,  // I/O, malformed external configuration
  kNote,       // Auxiliary message
};

// Position in a source document (0-based, as reported by yaml-cpp).
struct SourceMark {
  int line = 0;
  int column = 0;

  auto operator==(const SourceMark&) const -> bool = default;
};

struct Diagnostic {
  DiagKind kind;
  std::string message;
  std::optional<SourceMark> mark;
  std::vector<std::string> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  static auto Conflict(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = DiagKind::kConflict,
        .message = std::move(msg),
        .mark = std::nullopt,
        .notes = {},
    };
  }

  static auto Parsing(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = DiagKind::kParsing,
        .message = std::move(msg),
        .mark = std::nullopt,
        .notes = {},
    };
  }

  static auto Parsing(SourceMark mark, std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = DiagKind::kParsing,
        .message = std::move(msg),
        .mark = mark,
        .notes = {},
    };
  }

  static auto Lookup(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = DiagKind::kLookup,
        .message = std::move(msg),
        .mark = std::nullopt,
        .notes = {},
    };
  }

  static auto Import(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = DiagKind::kImport,
        .message = std::move(msg),
        .mark = std::nullopt,
        .notes = {},
    };
  }

  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = DiagKind::kHostError,
        .message = std::move(msg),
        .mark = std::nullopt,
        .notes = {},
    };
  }

  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(std::move(msg));
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

// Renders "line:col: message" (1-based) followed by one "note: ..." line per
// note. Used for what() and by the driver when colors are off.
auto FormatDiagnostic(const Diagnostic& diag) -> std::string;

class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag)
      : diag_(std::move(diag)), what_(FormatDiagnostic(diag_)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return what_.c_str();
  }

 private:
  Diagnostic diag_;
  std::string what_;
};

// Registration time: a tag is already bound to a different type.
class ConflictError final : public DiagnosticException {
 public:
  explicit ConflictError(std::string msg)
      : DiagnosticException(Diagnostic::Conflict(std::move(msg))) {
  }
};

// Decode time, user-facing.
class ParsingError final : public DiagnosticException {
 public:
  explicit ParsingError(std::string msg)
      : DiagnosticException(Diagnostic::Parsing(std::move(msg))) {
  }
  explicit ParsingError(Diagnostic diag)
      : DiagnosticException(std::move(diag)) {
  }
};

// Raw table miss. Never escapes the decode bridge.
class LookupError final : public DiagnosticException {
 public:
  explicit LookupError(std::string msg)
      : DiagnosticException(Diagnostic::Lookup(std::move(msg))) {
  }
};

// Discovery time: package or module import failure.
class ImportError final : public DiagnosticException {
 public:
  explicit ImportError(std::string msg)
      : DiagnosticException(Diagnostic::Import(std::move(msg))) {
  }
};

}  // namespace choice
