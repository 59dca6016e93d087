// miniyaml/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "miniyaml/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>

#include "miniyaml/basic/utf8.hpp"

namespace miniyaml
{

namespace
{

constexpr uint32_t k_tab_width = 4;

/// Visual width of the first `chars` scalar values of `line` (tabs expand).
uint32_t visual_width(std::string_view line, uint32_t chars)
{
  uint32_t width = 0;
  size_t i = 0;
  for (uint32_t n = 0; n < chars && i < line.size(); ++n) {
    width += (line[i] == '\t') ? k_tab_width : 1;
    i += utf8::decode(line, i).width;
  }
  return width;
}

std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out.append(k_tab_width, ' ');
    } else {
      out += c;
    }
  }
  return out;
}

rang::fg severity_color(Severity severity)
{
  switch (severity) {
    case Severity::Bug:
      return rang::fg::magenta;
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
    case Severity::Help:
      return rang::fg::cyan;
    case Severity::Note:
      return rang::fg::green;
  }
  return rang::fg::reset;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceFile & source)
{
  print_severity_header(diag);

  // === Location line: --> file:line:col ===
  const ByteSpan primary = diag.primary_span();
  const auto pos = source.position(primary.start());
  if (primary.is_valid() && pos) {
    fmt::print(
      os_, "{} {}:{}:{}\n", gutter_arrow(), source.display_name(), pos->line_idx + 1,
      pos->character_idx + 1);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), source.display_name());
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    print_label_context(label, source);
  }

  for (const auto & f : diag.fixits) {
    print_fixit(f, source);
  }

  if (diag.help_message) {
    print_trailer("help", *diag.help_message);
  }
  for (const auto & note : diag.notes) {
    print_trailer("note", note);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const std::vector<Diagnostic> & diags, const SourceFile & source)
{
  std::vector<const Diagnostic *> sorted;
  sorted.reserve(diags.size());
  for (const auto & d : diags) {
    sorted.push_back(&d);
  }

  std::stable_sort(sorted.begin(), sorted.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return a->primary_span().start() < b->primary_span().start();
  });

  for (const Diagnostic * d : sorted) {
    print(*d, source);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view name = to_string(diag.severity);
  if (use_color_) {
    os_ << rang::style::bold << severity_color(diag.severity) << name;
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", name, diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", name, diag.message);
  }
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceFile & source)
{
  if (!label.span.is_valid()) {
    if (!label.message.empty()) {
      print_trailer("note", label.message);
    }
    return;
  }

  const auto start = source.position(label.span.start());
  const auto end = source.position(label.span.end());
  if (!start) {
    return;
  }

  // Multi-line spans are marked on their first line only.
  const uint32_t end_char =
    (end && end->line_idx == start->line_idx && end->character_idx > start->character_idx)
      ? end->character_idx
      : start->character_idx + 1;

  print_source_line(
    source.line(start->line_idx), start->line_idx + 1, start->character_idx, end_char,
    label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  std::string_view line, uint32_t line_number, uint32_t start_char, uint32_t end_char,
  LabelStyle style, std::string_view label_message)
{
  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_number);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_number);
  }
  fmt::print(os_, "{}\n", expand_tabs(line));

  const uint32_t prefix = visual_width(line, start_char);
  uint32_t marker_len = visual_width(line, end_char) - prefix;
  if (marker_len == 0) {
    marker_len = 1;
  }

  fmt::print(os_, "      {} {}", gutter_pipe_only(), std::string(prefix, ' '));

  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';
  if (use_color_) {
    if (style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  fmt::print(os_, "{}", std::string(marker_len, marker_char));
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_fixit(const FixIt & fixit, const SourceFile & source)
{
  const auto start = source.position(fixit.span.start());
  if (!start) {
    print_trailer("fix", fmt::format("insert \"{}\"", fixit.replacement_text));
    return;
  }

  const auto slice = fixit.span.slice(source.text());
  const std::string_view replaced = slice ? *slice : std::string_view{};
  if (replaced.empty()) {
    print_trailer(
      "fix", fmt::format(
               "insert \"{}\" at {}:{}", fixit.replacement_text, start->line_idx + 1,
               start->character_idx + 1));
  } else {
    print_trailer(
      "fix", fmt::format(
               "replace \"{}\" with \"{}\" at {}:{}", replaced, fixit.replacement_text,
               start->line_idx + 1, start->character_idx + 1));
  }
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "{}: {}\n", kind, message);
  } else {
    fmt::print(os_, "   = {}: {}\n", kind, message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}  -->{}", "\033[1;36m", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  if (use_color_) {
    return fmt::format("{}|{}", "\033[1;36m", "\033[0m");
  }
  return "|";
}

}  // namespace miniyaml
