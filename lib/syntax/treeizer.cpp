#include "miniyaml/syntax/treeizer.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <utility>

#include "miniyaml/basic/utf8.hpp"

namespace miniyaml::syntax
{
namespace
{

ByteSpan span_of(const Node & node) { return node.span().value_or(ByteSpan{}); }

}  // namespace

Tree Treeizer::run()
{
  tree_ = Tree{};
  parent_stack_.clear();

  for (const Node & node : nodes_) {
    if (node.is_whitespace_only()) {
      // Nothing structural to place.
      diags_.report_warning(node.indentation->span, "Found a whitespace-only line")
        .with_code("A:W0001")
        .with_help("Consider making the line empty");
      continue;
    }

    if (node.is_empty()) {
      // Blank lines keep the current ancestor chain.
      const NodeId id = tree_.add(node);
      attach(tree_.sentinel(), id, node, "A:E0006");
      continue;
    }

    if (!node.indentation) {
      // An unindented line starts a new top-level tree.
      parent_stack_.clear();
      const NodeId id = tree_.add(node);
      attach(tree_.sentinel(), id, node, "A:E0006");
      if (!node.is_comment_only()) {
        parent_stack_.push_back(id);
      }
      continue;
    }

    place_indented(node);
  }

  parent_stack_.clear();
  return std::move(tree_);
}

void Treeizer::place_indented(const Node & node)
{
  const Token & indent = *node.indentation;
  const std::string_view indent_text = indent.slice(src_).value_or(std::string_view{});

  const bool is_all_space =
    std::all_of(indent_text.begin(), indent_text.end(), [](char c) { return c == ' '; });
  const bool is_all_tab =
    std::all_of(indent_text.begin(), indent_text.end(), [](char c) { return c == '\t'; });

  if (!is_all_space && !is_all_tab) {
    diags_
      .report_error(
        indent.span, "Indentation must be entirely made up of either spaces or tabs, but not both")
      .with_code("A:E0001");

    // The level is meaningless, so do not guess a parent.
    const NodeId id = tree_.add(node);
    attach(tree_.sentinel(), id, node, "A:E0006");
    return;
  }

  const size_t level = utf8::count_scalars(indent_text);
  if (is_all_space && level % k_spaces_per_indent_level != 0) {
    diags_
      .report_error(
        indent.span,
        fmt::format(
          "Column number must be a multiple of {} when using spaces", k_spaces_per_indent_level))
      .with_code("A:E0002")
      .with_help(fmt::format("Column number is currently {}", level));
  }

  if (parent_stack_.empty()) {
    diags_.report_error(span_of(node), "Unable to determine parent node due to indentation")
      .with_code("A:E0010");
    const NodeId id = tree_.add(node);
    attach(tree_.sentinel(), id, node, "A:E0006");
    parent_stack_.push_back(id);
    return;
  }

  const NodeId top = parent_stack_.back();
  const IndentLevelDelta d = delta(top, node);

  switch (d.kind) {
    case IndentLevelDelta::Kind::NoChange: {
      // Sibling of the current top.
      parent_stack_.pop_back();
      const NodeId id = tree_.add(node);
      const auto sibling_parent = tree_.parent(top);
      if (sibling_parent) {
        attach(*sibling_parent, id, node, "A:E0006");
      } else {
        diags_
          .report_bug(
            span_of(node),
            "Determined there was no indentation change from the previous node, but it has no "
            "parent")
          .with_code("A:E0007");
        attach(tree_.sentinel(), id, node, "A:E0006");
      }
      parent_stack_.push_back(id);
      return;
    }

    case IndentLevelDelta::Kind::MoreIndented: {
      if (is_all_space && d.amount != k_spaces_per_indent_level) {
        const std::string help =
          d.amount > k_spaces_per_indent_level
            ? fmt::format("Consider deleting {} space(s)", d.amount - k_spaces_per_indent_level)
            : fmt::format("Consider adding {} space(s)", k_spaces_per_indent_level - d.amount);
        diags_
          .report_error(
            indent.span,
            fmt::format("Indentation difference must be {} spaces", k_spaces_per_indent_level))
          .with_code("A:E0004")
          .with_help(help)
          .with_fixit(
            indent.span,
            std::string(indent.span.length() - d.amount + k_spaces_per_indent_level, ' '));
      } else if (is_all_tab && d.amount != k_tabs_per_indent_level) {
        diags_
          .report_error(
            indent.span,
            fmt::format("Indentation difference must be {} tab(s)", k_tabs_per_indent_level))
          .with_code("A:E0005");
      }

      const NodeId id = tree_.add(node);
      attach(top, id, node, "A:E0006");
      parent_stack_.push_back(id);
      return;
    }

    case IndentLevelDelta::Kind::LessIndented: {
      const size_t step = is_all_space ? k_spaces_per_indent_level : k_tabs_per_indent_level;
      const IndentLevelDelta wanted{IndentLevelDelta::Kind::LessIndented, step};

      // Nearest ancestor exactly one level shallower than `node`.
      auto it = std::find_if(parent_stack_.rbegin(), parent_stack_.rend(), [&](NodeId ancestor) {
        const Node * a = tree_.node(ancestor);
        if (a == nullptr) {
          return false;
        }
        return IndentLevelDelta::calc(node.indentation_level(src_), a->indentation_level(src_)) ==
               wanted;
      });

      if (it == parent_stack_.rend()) {
        diags_.report_error(span_of(node), "Unable to determine parent node due to indentation")
          .with_code("A:E0009");
        const NodeId id = tree_.add(node);
        attach(tree_.sentinel(), id, node, "A:E0006");
        return;
      }

      const NodeId parent = *it;
      parent_stack_.erase(it.base(), parent_stack_.end());

      const NodeId id = tree_.add(node);
      attach(parent, id, node, "A:E0008");
      parent_stack_.push_back(id);
      return;
    }
  }
}

void Treeizer::attach(NodeId parent, NodeId child, const Node & node, const char * code)
{
  if (tree_.append_child(parent, child)) {
    return;
  }

  const std::string msg = fmt::format(
    "Got an error attempting to make `{}` a child of `{}`", child.index, parent.index);
  spdlog::error("{}", msg);
  diags_.report_bug(span_of(node), msg).with_code(code);
}

IndentLevelDelta Treeizer::delta(NodeId from, const Node & to) const
{
  const Node * a = tree_.node(from);
  const size_t a_level = (a != nullptr) ? a->indentation_level(src_) : 0;
  return IndentLevelDelta::calc(a_level, to.indentation_level(src_));
}

TreeizeResult treeize(gsl::span<const Node> nodes, std::string_view src)
{
  Treeizer treeizer(nodes, src);
  TreeizeResult result;
  result.tree = treeizer.run();
  result.diagnostics = treeizer.take_diagnostics();
  return result;
}

}  // namespace miniyaml::syntax
