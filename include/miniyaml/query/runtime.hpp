// miniyaml/query/runtime.hpp - Revision clock and dependency recording
//
// A query engine is a set of storages (one per QueryKind) plus a Runtime.
// While a derived query executes, every input or derived value it reads is
// recorded on the active frame; those edges are later used to decide whether
// a memoized value is still valid at the current revision.
//
#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "miniyaml/query/query_kind.hpp"

namespace miniyaml::query
{

using Revision = uint64_t;

/// Identifies one slot: the query kind plus the slot index inside its storage.
struct DatabaseKeyIndex
{
  QueryKind kind = QueryKind::COUNT;
  uint32_t key_index = 0;

  [[nodiscard]] bool operator==(const DatabaseKeyIndex & other) const noexcept
  {
    return kind == other.kind && key_index == other.key_index;
  }
  [[nodiscard]] bool operator!=(const DatabaseKeyIndex & other) const noexcept
  {
    return !(*this == other);
  }
};

enum class EventKind : uint8_t {
  WillExecute,          // a derived query is about to (re)compute
  DidValidateMemoized,  // a memoized value was reused
};

struct Event
{
  EventKind kind;
  DatabaseKeyIndex key;
};

using EventHook = std::function<void(const Event &)>;

/// Raised when a query (directly or transitively) reads itself.
class CycleError : public std::runtime_error
{
public:
  explicit CycleError(const std::string & what) : std::runtime_error(what) {}
};

class Runtime
{
public:
  struct ActiveQuery
  {
    DatabaseKeyIndex key;
    Revision changed_at = 0;  // newest `changed_at` among everything read
    std::vector<DatabaseKeyIndex> dependencies;
  };

  Runtime() = default;

  /// Fresh runtime at the same revision; the active stack is not copied.
  Runtime(Revision revision, EventHook hook) : revision_(revision), hook_(std::move(hook)) {}

  Runtime(const Runtime &) = delete;
  Runtime & operator=(const Runtime &) = delete;

  [[nodiscard]] Revision current_revision() const noexcept { return revision_; }

  /// Start a new revision; called by every input write.
  Revision bump_revision() noexcept { return ++revision_; }

  [[nodiscard]] std::recursive_mutex & mutex() noexcept { return mutex_; }

  // Active query stack
  void push_frame(DatabaseKeyIndex key);
  ActiveQuery pop_frame();
  [[nodiscard]] bool is_active(DatabaseKeyIndex key) const noexcept;

  /// Record a read on the innermost active frame, if any.
  void report_read(DatabaseKeyIndex key, Revision changed_at);

  /// Human-readable chain of active queries ending in `key`.
  [[nodiscard]] std::string describe_cycle(DatabaseKeyIndex key) const;

  // Events
  void set_event_hook(EventHook hook) { hook_ = std::move(hook); }
  [[nodiscard]] const EventHook & event_hook() const noexcept { return hook_; }
  void emit(EventKind kind, DatabaseKeyIndex key) const;

private:
  Revision revision_ = 1;
  std::vector<ActiveQuery> stack_;
  EventHook hook_;
  std::recursive_mutex mutex_;
};

}  // namespace miniyaml::query
