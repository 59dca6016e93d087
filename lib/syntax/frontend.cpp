// miniyaml/syntax/frontend.cpp - High-level parse pipeline
#include "miniyaml/syntax/frontend.hpp"

#include <iterator>
#include <utility>

#include "miniyaml/syntax/nodeizer.hpp"
#include "miniyaml/syntax/tokenizer.hpp"
#include "miniyaml/syntax/treeizer.hpp"

namespace miniyaml::syntax
{

namespace
{

void append(std::vector<Diagnostic> & out, std::vector<Diagnostic> && more)
{
  out.insert(out.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
}

}  // namespace

ParseResult parse_text(FileId file_id, std::string_view text)
{
  ParseResult result;

  auto lexed = tokenize(file_id, text);
  result.tokens = std::move(lexed.tokens);
  append(result.diagnostics, std::move(lexed.diagnostics));

  auto grouped = nodeize(result.tokens);
  result.nodes = std::move(grouped.nodes);
  append(result.diagnostics, std::move(grouped.diagnostics));

  auto built = treeize(result.nodes, text);
  result.tree = std::move(built.tree);
  append(result.diagnostics, std::move(built.diagnostics));

  return result;
}

}  // namespace miniyaml::syntax
