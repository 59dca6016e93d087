// miniyaml/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "miniyaml/basic/diagnostic.hpp"
#include "miniyaml/basic/source_file.hpp"

namespace miniyaml
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[A:E0002]: Column number must be a multiple of 4 when using spaces
 *     --> rules/infantry.yaml:3:1
 *      |
 *    3 |    Tooltip:
 *      | ^^^
 *      |
 *      = help: Column number is currently 3
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceFile & source);

  /// Print in source order (stable for equal positions).
  void print_all(const std::vector<Diagnostic> & diags, const SourceFile & source);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceFile & source);

  void print_source_line(
    std::string_view line, uint32_t line_number, uint32_t start_char, uint32_t end_char,
    LabelStyle style, std::string_view label_message);

  void print_fixit(const FixIt & fixit, const SourceFile & source);
  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace miniyaml
