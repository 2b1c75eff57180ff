#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace proba {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,      // Invalid user input (source, test case, cases file)
  kHostError,  // I/O, transport, malformed external input
  kWarning,    // Non-fatal
  kNote,       // Auxiliary message
};

// 1-based position inside a submitted snippet
struct SourcePosition {
  uint32_t line = 1;
  uint32_t column = 1;

  auto operator==(const SourcePosition&) const -> bool = default;
};

// Represents missing position (for host errors)
struct UnknownPosition {
  auto operator==(const UnknownPosition&) const -> bool = default;
};

using DiagPosition = std::variant<SourcePosition, UnknownPosition>;

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  DiagPosition position;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: error in user-provided input
  static auto Error(SourcePosition pos, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .position = pos,
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: host error without source location
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .position = UnknownPosition{},
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Add a note without source location
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .position = UnknownPosition{},
            .message = std::move(msg),
        });
    return std::move(*this);
  }

  [[nodiscard]] auto Line() const -> std::optional<uint32_t> {
    if (const auto* pos = std::get_if<SourcePosition>(&primary.position)) {
      return pos->line;
    }
    return std::nullopt;
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace proba
