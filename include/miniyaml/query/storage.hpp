// miniyaml/query/storage.hpp - Input slots and memoized derived queries
#pragma once

#include <spdlog/spdlog.h>

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

#include "miniyaml/query/query_kind.hpp"
#include "miniyaml/query/runtime.hpp"

namespace miniyaml::query
{

class QueryStorageBase;

/// What a storage needs from the database that owns it.
class QueryContext
{
public:
  virtual ~QueryContext() = default;

  [[nodiscard]] virtual Runtime & runtime() const = 0;
  [[nodiscard]] virtual QueryStorageBase & storage_for(QueryKind kind) const = 0;
};

class QueryStorageBase
{
public:
  explicit QueryStorageBase(QueryKind kind) : kind_(kind) {}
  virtual ~QueryStorageBase() = default;

  QueryStorageBase(const QueryStorageBase &) = default;
  QueryStorageBase & operator=(const QueryStorageBase &) = default;

  [[nodiscard]] QueryKind kind() const noexcept { return kind_; }

  /**
   * Whether the value in slot `key_index` may differ from what a reader saw
   * at revision `since`. Derived storages may recompute to find out.
   */
  [[nodiscard]] virtual bool maybe_changed_since(
    const QueryContext & ctx, uint32_t key_index, Revision since) = 0;

  [[nodiscard]] virtual size_t slot_count() const noexcept = 0;

protected:
  QueryKind kind_;
};

// ============================================================================
// Value comparison (backdating)
// ============================================================================

template <typename T>
struct ValueEq
{
  bool operator()(const T & a, const T & b) const { return a == b; }
};

/// Shared immutable values compare by content.
template <typename T>
struct ValueEq<std::shared_ptr<const T>>
{
  bool operator()(const std::shared_ptr<const T> & a, const std::shared_ptr<const T> & b) const
  {
    if (a == b) {
      return true;
    }
    if (!a || !b) {
      return false;
    }
    return *a == *b;
  }
};

// ============================================================================
// Key hashing
// ============================================================================

struct TupleHash
{
  template <typename... Ts>
  size_t operator()(const std::tuple<Ts...> & t) const
  {
    return std::apply(
      [](const auto &... parts) {
        size_t seed = 0;
        ((seed ^= std::hash<std::decay_t<decltype(parts)>>{}(parts) + 0x9e3779b97f4a7c15ULL +
                  (seed << 6U) + (seed >> 2U)),
         ...);
        return seed;
      },
      t);
  }
};

// ============================================================================
// InputStorage
// ============================================================================

/// Values set from outside. Reading an unset key yields an empty optional
/// and still records the dependency, so a later `set` invalidates the reader.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class InputStorage final : public QueryStorageBase
{
public:
  explicit InputStorage(QueryKind kind) : QueryStorageBase(kind) {}

  [[nodiscard]] std::optional<Value> get(const QueryContext & ctx, const Key & key)
  {
    Runtime & rt = ctx.runtime();
    std::lock_guard<std::recursive_mutex> lock(rt.mutex());

    const uint32_t idx = index_of(key);
    const Slot & slot = slots_[idx];
    rt.report_read(DatabaseKeyIndex{kind_, idx}, slot.changed_at);
    return slot.value;
  }

  void set(const QueryContext & ctx, const Key & key, Value value)
  {
    Runtime & rt = ctx.runtime();
    std::lock_guard<std::recursive_mutex> lock(rt.mutex());

    const Revision rev = rt.bump_revision();
    Slot & slot = slots_[index_of(key)];
    slot.value = std::move(value);
    slot.changed_at = rev;
  }

  void remove(const QueryContext & ctx, const Key & key)
  {
    Runtime & rt = ctx.runtime();
    std::lock_guard<std::recursive_mutex> lock(rt.mutex());

    const Revision rev = rt.bump_revision();
    Slot & slot = slots_[index_of(key)];
    slot.value.reset();
    slot.changed_at = rev;
  }

  [[nodiscard]] bool maybe_changed_since(
    const QueryContext & /*ctx*/, uint32_t key_index, Revision since) override
  {
    if (key_index >= slots_.size()) {
      return true;
    }
    return slots_[key_index].changed_at > since;
  }

  [[nodiscard]] size_t slot_count() const noexcept override { return slots_.size(); }

private:
  struct Slot
  {
    Key key;
    std::optional<Value> value;
    Revision changed_at = 0;
  };

  uint32_t index_of(const Key & key)
  {
    const auto it = index_.find(key);
    if (it != index_.end()) {
      return it->second;
    }
    const auto idx = static_cast<uint32_t>(slots_.size());
    slots_.push_back(Slot{key, std::nullopt, 0});
    index_.emplace(key, idx);
    return idx;
  }

  std::deque<Slot> slots_;  // deque: references stay valid while slots are added
  std::unordered_map<Key, uint32_t, Hash> index_;
};

// ============================================================================
// DerivedStorage
// ============================================================================

/**
 * Memoized pure function of other queries.
 *
 * A memo is reused when every recorded dependency is unchanged since it was
 * last verified. A recomputed value equal to the previous one keeps the old
 * `changed_at`, so queries depending on it stay valid.
 */
template <typename Db, typename Key, typename Value, typename Hash = std::hash<Key>>
class DerivedStorage final : public QueryStorageBase
{
public:
  using ComputeFn = Value (*)(const Db &, const Key &);

  DerivedStorage(QueryKind kind, ComputeFn compute) : QueryStorageBase(kind), compute_(compute) {}

  [[nodiscard]] Value fetch(const Db & db, const Key & key)
  {
    Runtime & rt = db.runtime();
    std::lock_guard<std::recursive_mutex> lock(rt.mutex());

    const uint32_t idx = index_of(key);
    const DatabaseKeyIndex dki{kind_, idx};
    if (rt.is_active(dki)) {
      throw CycleError(rt.describe_cycle(dki));
    }

    Slot & slot = slots_[idx];
    if (!validate(db, slot, dki)) {
      execute(db, slot, dki);
    }

    rt.report_read(dki, slot.memo->changed_at);
    return slot.memo->value;
  }

  [[nodiscard]] bool maybe_changed_since(
    const QueryContext & ctx, uint32_t key_index, Revision since) override
  {
    if (key_index >= slots_.size() || slots_[key_index].retired) {
      return true;
    }

    const Db & db = static_cast<const Db &>(ctx);
    Runtime & rt = db.runtime();
    const DatabaseKeyIndex dki{kind_, key_index};
    if (rt.is_active(dki)) {
      throw CycleError(rt.describe_cycle(dki));
    }

    Slot & slot = slots_[key_index];
    if (!validate(db, slot, dki)) {
      execute(db, slot, dki);
    }
    return slot.memo->changed_at > since;
  }

  /**
   * Forget every key matching `pred` together with its memo.
   *
   * The slot index is never handed out again; readers that depended on it
   * see it as changed and recompute.
   */
  template <typename Pred>
  void purge(const QueryContext & ctx, Pred pred)
  {
    std::lock_guard<std::recursive_mutex> lock(ctx.runtime().mutex());

    auto it = index_.begin();
    while (it != index_.end()) {
      if (!pred(it->first)) {
        ++it;
        continue;
      }
      Slot & slot = slots_[it->second];
      slot.memo.reset();
      slot.key = Key{};
      slot.retired = true;
      it = index_.erase(it);
    }
  }

  /// Live keys; purged slots are not counted.
  [[nodiscard]] size_t slot_count() const noexcept override { return index_.size(); }

private:
  struct Memo
  {
    Value value;
    Revision verified_at = 0;
    Revision changed_at = 0;
    std::vector<DatabaseKeyIndex> dependencies;
  };

  struct Slot
  {
    Key key;
    std::optional<Memo> memo;
    bool retired = false;
  };

  bool validate(const Db & db, Slot & slot, DatabaseKeyIndex dki)
  {
    if (!slot.memo) {
      return false;
    }

    Runtime & rt = db.runtime();
    const Revision now = rt.current_revision();
    Memo & memo = *slot.memo;

    if (memo.verified_at != now) {
      for (const DatabaseKeyIndex & dep : memo.dependencies) {
        if (db.storage_for(dep.kind).maybe_changed_since(db, dep.key_index, memo.verified_at)) {
          return false;
        }
      }
      memo.verified_at = now;
    }

    rt.emit(EventKind::DidValidateMemoized, dki);
    return true;
  }

  void execute(const Db & db, Slot & slot, DatabaseKeyIndex dki)
  {
    Runtime & rt = db.runtime();
    rt.emit(EventKind::WillExecute, dki);
    spdlog::trace("executing {}#{}", query_kind_name(kind_), dki.key_index);

    rt.push_frame(dki);
    std::optional<Value> value;
    try {
      value.emplace(compute_(db, slot.key));
    } catch (...) {
      (void)rt.pop_frame();
      throw;
    }
    Runtime::ActiveQuery frame = rt.pop_frame();

    Revision changed_at = frame.changed_at;
    if (slot.memo && ValueEq<Value>{}(slot.memo->value, *value)) {
      changed_at = slot.memo->changed_at;
    }

    slot.memo = Memo{std::move(*value), rt.current_revision(), changed_at, std::move(frame.dependencies)};
  }

  uint32_t index_of(const Key & key)
  {
    const auto it = index_.find(key);
    if (it != index_.end()) {
      return it->second;
    }
    const auto idx = static_cast<uint32_t>(slots_.size());
    slots_.push_back(Slot{key, std::nullopt, false});
    index_.emplace(key, idx);
    return idx;
  }

  ComputeFn compute_;
  std::deque<Slot> slots_;
  std::unordered_map<Key, uint32_t, Hash> index_;
};

}  // namespace miniyaml::query
