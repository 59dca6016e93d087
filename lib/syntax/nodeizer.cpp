#include "miniyaml/syntax/nodeizer.hpp"

#include <algorithm>

namespace miniyaml::syntax
{

std::vector<Node> Nodeizer::run()
{
  std::vector<Node> nodes;
  Node current;
  bool line_has_tokens = false;

  while (!eof()) {
    const Token & token = tokens_[pos_++];

    if (token.kind == TokenKind::EndOfLine) {
      nodes.push_back(std::move(current));
      current = Node{};
      line_has_tokens = false;
      continue;
    }

    place(current, token);
    line_has_tokens = true;
  }

  if (line_has_tokens) {
    nodes.push_back(std::move(current));
  }

  return nodes;
}

void Nodeizer::place(Node & node, const Token & token)
{
  switch (token.kind) {
    case TokenKind::Comment:
      node.comment = token;
      return;

    case TokenKind::Whitespace:
      if (node.key_terminator) {
        node.value_tokens.push_back(token);
      } else if (node.key_tokens.empty() && !node.indentation) {
        node.indentation = token;
      } else {
        node.key_tokens.push_back(token);
      }
      return;

    case TokenKind::Colon:
      place_colon(node, token);
      return;

    case TokenKind::Bang:
      if (!node.key_terminator) {
        diags_.report_error(token.span, "`!` is not valid in key position")
          .with_code("N:E0002");
        node.key_tokens.push_back(token);
      } else {
        node.value_tokens.push_back(token);
      }
      return;

    case TokenKind::At:
      place_at(node, token);
      return;

    case TokenKind::Caret:
      place_caret(node, token);
      return;

    default:
      if (node.key_terminator) {
        node.value_tokens.push_back(token);
      } else {
        node.key_tokens.push_back(token);
      }
      return;
  }
}

void Nodeizer::place_colon(Node & node, const Token & token)
{
  if (node.key_terminator) {
    node.value_tokens.push_back(token);
    return;
  }

  const bool has_key = std::any_of(node.key_tokens.begin(), node.key_tokens.end(), [](const Token & t) {
    return t.kind != TokenKind::Whitespace;
  });
  if (!has_key) {
    diags_.report_error(token.span, "expected a key before `:`")
      .with_code("N:E0001")
      .with_help("only empty and comment-only lines may omit the key");
  }

  node.key_terminator = token;
}

void Nodeizer::place_at(Node & node, const Token & token)
{
  if (node.key_terminator) {
    node.value_tokens.push_back(token);
    return;
  }

  const Token * next = peek();
  if (next != nullptr && !next->is_identifier_or_number()) {
    diags_.report_error(token.span, "expected identifier or number after `@`")
      .with_code("N:E0003")
      .with_secondary_label(next->span, "found this instead");
  }
  node.key_tokens.push_back(token);
}

void Nodeizer::place_caret(Node & node, const Token & token)
{
  const Token * next = peek();
  const bool bad = next != nullptr && next->kind != TokenKind::Identifier;

  if (node.key_terminator) {
    // In a value this may just be text, so only warn.
    if (bad) {
      diags_.report_warning(token.span, "expected identifier after `^`").with_code("N:W0001");
    }
    node.value_tokens.push_back(token);
    return;
  }

  if (bad) {
    diags_.report_error(token.span, "expected identifier after `^`")
      .with_code("N:E0004")
      .with_help("inheritance is written as `^ParentName`");
  }
  node.key_tokens.push_back(token);
}

NodeizeResult nodeize(gsl::span<const Token> tokens)
{
  Nodeizer nodeizer(tokens);
  NodeizeResult result;
  result.nodes = nodeizer.run();
  result.diagnostics = nodeizer.take_diagnostics();
  return result;
}

}  // namespace miniyaml::syntax
