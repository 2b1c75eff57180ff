#include "print.hpp"

#include <string>
#include <string_view>
#include <variant>

#include <fmt/color.h>
#include <fmt/core.h>

#include "proba/common/diagnostic.hpp"
#include "proba/common/overloaded.hpp"

namespace proba::driver {

namespace {

struct Tag {
  std::string_view label;
  fmt::terminal_color color;
};

auto TagFor(DiagKind kind) -> Tag {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return {.label = "error:", .color = fmt::terminal_color::bright_red};
    case DiagKind::kWarning:
      return {.label = "warning:", .color = fmt::terminal_color::bright_yellow};
    case DiagKind::kNote:
      return {.label = "note:", .color = fmt::terminal_color::bright_cyan};
  }
  return {.label = "error:", .color = fmt::terminal_color::bright_red};
}

// "<origin>: <tag> <message>" on stderr.
void PrintTagged(
    std::string_view origin, DiagKind kind, std::string_view message,
    bool emphasize) {
  Tag tag = TagFor(kind);
  fmt::print(
      stderr, "{}: {} {}\n",
      fmt::styled(origin, fmt::fg(fmt::terminal_color::white) |
                              fmt::emphasis::bold),
      fmt::styled(tag.label, fmt::fg(tag.color) | fmt::emphasis::bold),
      fmt::styled(
          message, emphasize ? fmt::emphasis::bold : fmt::text_style{}));
}

auto Origin(const DiagPosition& position) -> std::string {
  return std::visit(
      common::Overloaded{
          [](const SourcePosition& pos) {
            return fmt::format("line {}:{}", pos.line, pos.column);
          },
          [](UnknownPosition) { return std::string("proba"); },
      },
      position);
}

}  // namespace

void PrintError(const std::string& message) {
  PrintTagged("proba", DiagKind::kError, message, true);
}

void PrintWarning(const std::string& message) {
  PrintTagged("proba", DiagKind::kWarning, message, true);
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintTagged(
      Origin(diag.primary.position), diag.primary.kind, diag.primary.message,
      true);
  for (const auto& note : diag.notes) {
    PrintTagged(Origin(note.position), note.kind, note.message, false);
  }
}

}  // namespace proba::driver
