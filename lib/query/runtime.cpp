#include "miniyaml/query/runtime.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <utility>

namespace miniyaml::query
{

void Runtime::push_frame(DatabaseKeyIndex key)
{
  ActiveQuery frame;
  frame.key = key;
  stack_.push_back(std::move(frame));
}

Runtime::ActiveQuery Runtime::pop_frame()
{
  ActiveQuery frame = std::move(stack_.back());
  stack_.pop_back();
  return frame;
}

bool Runtime::is_active(DatabaseKeyIndex key) const noexcept
{
  return std::any_of(
    stack_.begin(), stack_.end(), [&](const ActiveQuery & q) { return q.key == key; });
}

void Runtime::report_read(DatabaseKeyIndex key, Revision changed_at)
{
  if (stack_.empty()) {
    return;
  }
  ActiveQuery & top = stack_.back();
  top.changed_at = std::max(top.changed_at, changed_at);
  if (std::find(top.dependencies.begin(), top.dependencies.end(), key) == top.dependencies.end()) {
    top.dependencies.push_back(key);
  }
}

std::string Runtime::describe_cycle(DatabaseKeyIndex key) const
{
  std::string out;
  for (const auto & q : stack_) {
    out += fmt::format("{}#{} -> ", query_kind_name(q.key.kind), q.key.key_index);
  }
  out += fmt::format("{}#{}", query_kind_name(key.kind), key.key_index);
  return out;
}

void Runtime::emit(EventKind kind, DatabaseKeyIndex key) const
{
  if (hook_) {
    hook_(Event{kind, key});
  }
}

}  // namespace miniyaml::query
