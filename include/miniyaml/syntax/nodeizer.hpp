#pragma once

#include <cstddef>
#include <gsl/span>
#include <vector>

#include "miniyaml/basic/diagnostic.hpp"
#include "miniyaml/syntax/node.hpp"
#include "miniyaml/syntax/token.hpp"

namespace miniyaml::syntax
{

/**
 * Groups a token stream into one Node per line.
 *
 * Every token except EndOfLine ends up in exactly one node. A trailing line
 * without a terminator still produces a node.
 */
class Nodeizer
{
public:
  explicit Nodeizer(gsl::span<const Token> tokens) : tokens_(tokens) {}

  [[nodiscard]] std::vector<Node> run();

  [[nodiscard]] std::vector<Diagnostic> take_diagnostics() { return diags_.take(); }

private:
  [[nodiscard]] bool eof() const noexcept { return pos_ >= tokens_.size(); }

  /// Token after the current one, without consuming it.
  [[nodiscard]] const Token * peek() const noexcept
  {
    return (pos_ < tokens_.size()) ? &tokens_[pos_] : nullptr;
  }

  void place(Node & node, const Token & token);
  void place_colon(Node & node, const Token & token);
  void place_at(Node & node, const Token & token);
  void place_caret(Node & node, const Token & token);

  gsl::span<const Token> tokens_;
  size_t pos_ = 0;
  DiagnosticBag diags_;
};

struct NodeizeResult
{
  std::vector<Node> nodes;
  std::vector<Diagnostic> diagnostics;
};

[[nodiscard]] NodeizeResult nodeize(gsl::span<const Token> tokens);

}  // namespace miniyaml::syntax
