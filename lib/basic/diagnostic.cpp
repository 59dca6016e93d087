// miniyaml/basic/diagnostic.cpp - Diagnostic implementation
#include "miniyaml/basic/diagnostic.hpp"

#include <algorithm>
#include <utility>

namespace miniyaml
{

std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Bug:
      return "bug";
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Help:
      return "help";
    case Severity::Note:
      return "note";
  }
  return "unknown";
}

const Label * Diagnostic::primary_label() const noexcept
{
  for (const auto & l : labels) {
    if (l.style == LabelStyle::Primary) {
      return &l;
    }
  }
  if (!labels.empty()) {
    return &labels.front();
  }
  return nullptr;
}

ByteSpan Diagnostic::primary_span() const noexcept
{
  const Label * l = primary_label();
  if (l == nullptr) {
    return {};
  }
  return l->span;
}

bool Diagnostic::operator==(const Diagnostic & other) const
{
  return severity == other.severity && code == other.code && message == other.message &&
         labels == other.labels && fixits == other.fixits &&
         help_message == other.help_message && notes == other.notes;
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(ByteSpan span, std::string msg)
{
  diagnostic_.labels.push_back(Label{span, std::move(msg), LabelStyle::Secondary});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_fixit(ByteSpan span, std::string replacement)
{
  diagnostic_.fixits.push_back(FixIt{span, std::move(replacement)});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report(
  Severity severity, ByteSpan span, std::string message, std::string label_message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.labels.push_back(Label{span, std::move(label_message), LabelStyle::Primary});
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_bug(
  ByteSpan span, std::string message, std::string label_message)
{
  return report(Severity::Bug, span, std::move(message), std::move(label_message));
}

DiagnosticBuilder DiagnosticBag::report_error(
  ByteSpan span, std::string message, std::string label_message)
{
  return report(Severity::Error, span, std::move(message), std::move(label_message));
}

DiagnosticBuilder DiagnosticBag::report_warning(
  ByteSpan span, std::string message, std::string label_message)
{
  return report(Severity::Warning, span, std::move(message), std::move(label_message));
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

bool DiagnosticBag::has_errors() const
{
  return std::any_of(
    diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) { return d.is_error(); });
}

bool DiagnosticBag::has_warnings() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Warning;
  });
}

std::vector<Diagnostic> DiagnosticBag::take()
{
  std::vector<Diagnostic> out = std::move(diagnostics_);
  diagnostics_.clear();
  return out;
}

}  // namespace miniyaml
