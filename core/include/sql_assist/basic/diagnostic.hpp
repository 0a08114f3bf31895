// sql_assist/basic/diagnostic.hpp - Errors relayed to the editor
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "sql_assist/basic/source_manager.hpp"

namespace sql_assist
{

// ============================================================================
// Core Structures
// ============================================================================

/// Underlined source text with a short caption.
struct Label
{
  SourceRange range;
  std::string message;
};

/// An error reported against the query text.
struct Diagnostic
{
  std::string code;  // e.g. "E-REMOTE"
  std::string message;

  std::optional<Label> label;  // absent when no position is known
  std::optional<std::string> help_message;

  /// Range of the label, or an invalid range.
  [[nodiscard]] SourceRange range() const noexcept
  {
    return label ? label->range : SourceRange{};
  }
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and adds it to the owning bag when the
 * builder goes out of scope.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  /// Start an error. An invalid `range` produces a diagnostic without a label.
  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace sql_assist
