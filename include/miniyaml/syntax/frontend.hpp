// miniyaml/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <string_view>
#include <vector>

#include "miniyaml/basic/diagnostic.hpp"
#include "miniyaml/syntax/node.hpp"
#include "miniyaml/syntax/token.hpp"
#include "miniyaml/syntax/tree.hpp"

namespace miniyaml::syntax
{

struct ParseResult
{
  std::vector<Token> tokens;
  std::vector<Node> nodes;
  Tree tree;
  std::vector<Diagnostic> diagnostics;  // tokenizer, then nodeizer, then treeizer
};

// Parse pipeline:
// source -> tokenizer (tokens) -> nodeizer (one node per line) -> treeizer (tree)
[[nodiscard]] ParseResult parse_text(FileId file_id, std::string_view text);

}  // namespace miniyaml::syntax
