#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "miniyaml/syntax/node.hpp"

namespace miniyaml::syntax
{

/// Handle of a node inside a Tree arena.
struct NodeId
{
  uint32_t index = 0;

  [[nodiscard]] constexpr bool operator==(NodeId other) const noexcept
  {
    return index == other.index;
  }
  [[nodiscard]] constexpr bool operator!=(NodeId other) const noexcept
  {
    return index != other.index;
  }
};

/**
 * Arena of Nodes linked by indentation.
 *
 * The first entry is always a synthetic, parentless sentinel; every other
 * entry is the sentinel's child or a descendant of one. Entries are stored in
 * source order.
 */
class Tree
{
public:
  Tree();

  [[nodiscard]] NodeId sentinel() const noexcept { return NodeId{0}; }

  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool contains(NodeId id) const noexcept { return id.index < entries_.size(); }

  /// nullptr when `id` is not in this tree.
  [[nodiscard]] const Node * node(NodeId id) const noexcept;
  [[nodiscard]] std::optional<NodeId> parent(NodeId id) const noexcept;
  [[nodiscard]] const std::vector<NodeId> & children(NodeId id) const noexcept;

  /// Sentinel first, then every node in source order.
  [[nodiscard]] std::vector<NodeId> node_ids() const;

  /// Pre-order depth-first traversal below the sentinel. Depth 0 is top level.
  void walk(const std::function<void(NodeId, const Node &, size_t depth)> & visit) const;

  // Building
  NodeId add(Node node);

  /// Fails when either id is unknown or `child` already has a parent.
  [[nodiscard]] bool append_child(NodeId parent, NodeId child);

  [[nodiscard]] bool operator==(const Tree & other) const;
  [[nodiscard]] bool operator!=(const Tree & other) const { return !(*this == other); }

private:
  struct Entry
  {
    Node node;
    std::optional<NodeId> parent;
    std::vector<NodeId> children;

    [[nodiscard]] bool operator==(const Entry & other) const
    {
      return node == other.node && parent == other.parent && children == other.children;
    }
  };

  void walk_from(
    NodeId id, size_t depth,
    const std::function<void(NodeId, const Node &, size_t depth)> & visit) const;

  std::vector<Entry> entries_;
};

}  // namespace miniyaml::syntax
