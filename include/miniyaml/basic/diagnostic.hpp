// miniyaml/basic/diagnostic.hpp - Diagnostic types shared by every pipeline stage
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "miniyaml/basic/span.hpp"

namespace miniyaml
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 *
 * Help and Note are attached to another diagnostic (help_message / notes)
 * and are not reported on their own.
 */
enum class Severity : uint8_t {
  Bug,
  Error,
  Warning,
  Help,
  Note,
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

enum class LabelStyle : uint8_t {
  Primary,    // direct cause
  Secondary,  // related context
};

struct Label
{
  ByteSpan span;
  std::string message;
  LabelStyle style = LabelStyle::Primary;

  [[nodiscard]] bool operator==(const Label & other) const
  {
    return span == other.span && message == other.message && style == other.style;
  }
  [[nodiscard]] bool operator!=(const Label & other) const { return !(*this == other); }
};

struct FixIt
{
  ByteSpan span;
  std::string replacement_text;

  [[nodiscard]] bool operator==(const FixIt & other) const
  {
    return span == other.span && replacement_text == other.replacement_text;
  }
  [[nodiscard]] bool operator!=(const FixIt & other) const { return !(*this == other); }
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // e.g. "A:E0002"
  std::string message;

  std::vector<Label> labels;
  std::vector<FixIt> fixits;
  std::optional<std::string> help_message;
  std::vector<std::string> notes;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] ByteSpan primary_span() const noexcept;

  /// Bug and Error make a document invalid.
  [[nodiscard]] bool is_error() const noexcept
  {
    return severity == Severity::Bug || severity == Severity::Error;
  }

  [[nodiscard]] bool operator==(const Diagnostic & other) const;
  [[nodiscard]] bool operator!=(const Diagnostic & other) const { return !(*this == other); }
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and adds it to the bag on destruction (RAII).
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

  DiagnosticBuilder & with_secondary_label(ByteSpan span, std::string msg);

  DiagnosticBuilder & with_fixit(ByteSpan span, std::string replacement);

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

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_bug(ByteSpan span, std::string message, std::string label_message = "");
  DiagnosticBuilder report_error(
    ByteSpan span, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    ByteSpan span, std::string message, std::string label_message = "");

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;

  /// Return the collected diagnostics and leave the bag empty.
  [[nodiscard]] std::vector<Diagnostic> take();

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  DiagnosticBuilder report(
    Severity severity, ByteSpan span, std::string message, std::string label_message);

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace miniyaml
