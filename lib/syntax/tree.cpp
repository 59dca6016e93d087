#include "miniyaml/syntax/tree.hpp"

#include <utility>

namespace miniyaml::syntax
{

Tree::Tree() { entries_.push_back(Entry{}); }

const Node * Tree::node(NodeId id) const noexcept
{
  if (!contains(id)) {
    return nullptr;
  }
  return &entries_[id.index].node;
}

std::optional<NodeId> Tree::parent(NodeId id) const noexcept
{
  if (!contains(id)) {
    return std::nullopt;
  }
  return entries_[id.index].parent;
}

const std::vector<NodeId> & Tree::children(NodeId id) const noexcept
{
  static const std::vector<NodeId> k_none;
  if (!contains(id)) {
    return k_none;
  }
  return entries_[id.index].children;
}

std::vector<NodeId> Tree::node_ids() const
{
  std::vector<NodeId> ids;
  ids.reserve(entries_.size());
  for (uint32_t i = 0; i < entries_.size(); ++i) {
    ids.push_back(NodeId{i});
  }
  return ids;
}

void Tree::walk(const std::function<void(NodeId, const Node &, size_t depth)> & visit) const
{
  for (const NodeId child : entries_.front().children) {
    walk_from(child, 0, visit);
  }
}

void Tree::walk_from(
  NodeId id, size_t depth,
  const std::function<void(NodeId, const Node &, size_t depth)> & visit) const
{
  const Entry & entry = entries_[id.index];
  visit(id, entry.node, depth);
  for (const NodeId child : entry.children) {
    walk_from(child, depth + 1, visit);
  }
}

NodeId Tree::add(Node node)
{
  const NodeId id{static_cast<uint32_t>(entries_.size())};
  entries_.push_back(Entry{std::move(node), std::nullopt, {}});
  return id;
}

bool Tree::append_child(NodeId parent, NodeId child)
{
  if (!contains(parent) || !contains(child) || parent == child) {
    return false;
  }
  Entry & c = entries_[child.index];
  if (c.parent) {
    return false;
  }
  c.parent = parent;
  entries_[parent.index].children.push_back(child);
  return true;
}

bool Tree::operator==(const Tree & other) const { return entries_ == other.entries_; }

}  // namespace miniyaml::syntax
