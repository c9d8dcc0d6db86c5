// cfgc/basic/diagnostic.hpp - Diagnostics produced by the front-end and driver
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cfgc/basic/source_manager.hpp"

namespace cfgc
{

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
  Note,
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

enum class LabelStyle : uint8_t {
  Primary,    ///< the offending text
  Secondary,  ///< related context
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

/// Text to insert at `range` (an empty range means "insert here").
struct FixIt
{
  SourceRange range;
  std::string replacement_text;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  ///< e.g. "P001"; may be empty
  std::string message;

  std::vector<Label> labels;
  std::vector<FixIt> fixits;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder returned by DiagnosticBag::report_*.
 *
 * The diagnostic is committed to the bag when the builder is destroyed, so a
 * report is complete at the end of the full expression:
 *
 *   diags.report_error(range, "expected ';'").with_fixit(at_end, ";");
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;
  DiagnosticBuilder & operator=(DiagnosticBuilder &&) = delete;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);
  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);
  DiagnosticBuilder & with_fixit(SourceRange range, std::string replacement);
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

  DiagnosticBuilder report(
    Severity severity, SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic diag);
  void merge(DiagnosticBag && other);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] size_t count(Severity severity) const;
  [[nodiscard]] bool has_errors() const { return count(Severity::Error) > 0; }

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace cfgc
