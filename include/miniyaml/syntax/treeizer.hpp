#pragma once

#include <cstddef>
#include <cstdint>
#include <gsl/span>
#include <string_view>
#include <vector>

#include "miniyaml/basic/diagnostic.hpp"
#include "miniyaml/syntax/node.hpp"
#include "miniyaml/syntax/tree.hpp"

namespace miniyaml::syntax
{

inline constexpr size_t k_spaces_per_indent_level = 4;
inline constexpr size_t k_tabs_per_indent_level = 1;

/// Indentation of `b` relative to `a`.
struct IndentLevelDelta
{
  enum class Kind : uint8_t {
    LessIndented,
    NoChange,
    MoreIndented,
  };

  Kind kind = Kind::NoChange;
  size_t amount = 0;

  [[nodiscard]] static IndentLevelDelta calc(size_t a_level, size_t b_level) noexcept
  {
    if (b_level == a_level) {
      return {Kind::NoChange, 0};
    }
    if (b_level > a_level) {
      return {Kind::MoreIndented, b_level - a_level};
    }
    return {Kind::LessIndented, a_level - b_level};
  }

  [[nodiscard]] bool operator==(const IndentLevelDelta & other) const noexcept
  {
    return kind == other.kind && amount == other.amount;
  }
  [[nodiscard]] bool operator!=(const IndentLevelDelta & other) const noexcept
  {
    return !(*this == other);
  }
};

/**
 * Rebuilds parent/child structure from indentation.
 *
 * Every node except whitespace-only lines ends up in the tree; nodes whose
 * parent cannot be determined are attached to the sentinel and reported.
 */
class Treeizer
{
public:
  Treeizer(gsl::span<const Node> nodes, std::string_view src) : nodes_(nodes), src_(src) {}

  [[nodiscard]] Tree run();

  [[nodiscard]] std::vector<Diagnostic> take_diagnostics() { return diags_.take(); }

private:
  void place_indented(const Node & node);
  void attach(NodeId parent, NodeId child, const Node & node, const char * code);

  [[nodiscard]] IndentLevelDelta delta(NodeId from, const Node & to) const;

  gsl::span<const Node> nodes_;
  std::string_view src_;
  DiagnosticBag diags_;

  Tree tree_;
  std::vector<NodeId> parent_stack_;
};

struct TreeizeResult
{
  Tree tree;
  std::vector<Diagnostic> diagnostics;
};

[[nodiscard]] TreeizeResult treeize(gsl::span<const Node> nodes, std::string_view src);

}  // namespace miniyaml::syntax
