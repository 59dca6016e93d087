#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <stdexcept>
#include <string>

#include "miniyaml/lsp/work_pool.hpp"

using miniyaml::lsp::WorkLimits;
using miniyaml::lsp::WorkPool;
using miniyaml::lsp::WorkStatus;

namespace
{

WorkLimits limits(size_t max_concurrent, size_t max_similar)
{
  WorkLimits l;
  l.request_timeout = std::chrono::milliseconds(1500);
  l.max_concurrent_work = max_concurrent;
  l.max_similar_concurrent_work = max_similar;
  return l;
}

}  // namespace

TEST(LspWorkPool, RunsSubmittedWork)
{
  WorkPool pool(limits(2, 2));
  auto result = pool.submit<int>("textDocument/hover", WorkPool::Clock::now(), [] { return 7; }, 0)
                  .get();

  EXPECT_EQ(result.status, WorkStatus::Completed);
  EXPECT_EQ(result.value, 7);
  EXPECT_TRUE(result.error.empty());
  EXPECT_EQ(pool.in_flight(), 0U);
}

TEST(LspWorkPool, RefusesWhenAtCapacity)
{
  WorkPool pool(limits(1, 1));
  std::promise<void> gate;
  std::shared_future<void> opened = gate.get_future().share();

  auto blocked = pool.submit<int>(
    "textDocument/hover", WorkPool::Clock::now(),
    [opened] {
      opened.wait();
      return 1;
    },
    0);
  EXPECT_EQ(pool.in_flight(), 1U);

  auto refused =
    pool.submit<int>("textDocument/definition", WorkPool::Clock::now(), [] { return 2; }, -1)
      .get();
  EXPECT_EQ(refused.status, WorkStatus::Refused);
  EXPECT_EQ(refused.value, -1);

  gate.set_value();
  EXPECT_EQ(blocked.get().value, 1);
  EXPECT_EQ(pool.in_flight(), 0U);
}

TEST(LspWorkPool, RefusesTooManyOfTheSameKind)
{
  WorkPool pool(limits(4, 1));
  std::promise<void> gate;
  std::shared_future<void> opened = gate.get_future().share();

  auto blocked = pool.submit<int>(
    "textDocument/hover", WorkPool::Clock::now(),
    [opened] {
      opened.wait();
      return 1;
    },
    0);

  auto same_kind =
    pool.submit<int>("textDocument/hover", WorkPool::Clock::now(), [] { return 2; }, 0).get();
  EXPECT_EQ(same_kind.status, WorkStatus::Refused);

  auto other_kind =
    pool.submit<int>("textDocument/documentSymbol", WorkPool::Clock::now(), [] { return 3; }, 0)
      .get();
  EXPECT_EQ(other_kind.status, WorkStatus::Completed);
  EXPECT_EQ(other_kind.value, 3);

  gate.set_value();
  EXPECT_EQ(blocked.get().status, WorkStatus::Completed);
}

TEST(LspWorkPool, CallbackRunsOnceAfterTheSlotIsFreed)
{
  WorkPool pool(limits(1, 1));
  std::promise<void> gate;
  std::shared_future<void> opened = gate.get_future().share();

  std::promise<size_t> in_flight_at_completion;
  auto completion_seen = in_flight_at_completion.get_future();
  pool.submit<int>(
    "textDocument/hover", WorkPool::Clock::now(),
    [opened] {
      opened.wait();
      return 1;
    },
    0,
    [&pool, &in_flight_at_completion](miniyaml::lsp::WorkResult<int> result) {
      EXPECT_EQ(result.status, WorkStatus::Completed);
      EXPECT_EQ(result.value, 1);
      in_flight_at_completion.set_value(pool.in_flight());
    });

  // A refusal is reported before submit returns.
  bool refused = false;
  pool.submit<int>(
    "textDocument/definition", WorkPool::Clock::now(), [] { return 2; }, -1,
    [&refused](miniyaml::lsp::WorkResult<int> result) {
      refused = result.status == WorkStatus::Refused && result.value == -1;
    });
  EXPECT_TRUE(refused);

  gate.set_value();
  EXPECT_EQ(completion_seen.get(), 0U);
}

TEST(LspWorkPool, StaleRequestsTimeOutWithoutRunning)
{
  WorkPool pool(limits(1, 1));
  bool ran = false;
  const auto received_at = WorkPool::Clock::now() - pool.limits().request_timeout * 2;

  auto result = pool.submit<std::string>(
                      "textDocument/hover", received_at,
                      [&ran] {
                        ran = true;
                        return std::string("late");
                      },
                      std::string("fallback"))
                  .get();

  EXPECT_EQ(result.status, WorkStatus::TimedOut);
  EXPECT_EQ(result.value, "fallback");
  EXPECT_FALSE(ran);
}

TEST(LspWorkPool, ThrowingWorkIsReportedAsFailed)
{
  WorkPool pool(limits(1, 1));
  auto result = pool.submit<int>(
                      "textDocument/definition", WorkPool::Clock::now(),
                      []() -> int { throw std::runtime_error("boom"); }, 5)
                  .get();

  EXPECT_EQ(result.status, WorkStatus::Failed);
  EXPECT_EQ(result.value, 5);
  EXPECT_EQ(result.error, "boom");

  // The slot is released after a failure.
  auto next = pool.submit<int>("textDocument/definition", WorkPool::Clock::now(), [] { return 6; }, 0)
                .get();
  EXPECT_EQ(next.status, WorkStatus::Completed);
}

TEST(LspWorkPool, ZeroLimitsAreRaisedToOne)
{
  WorkPool pool(limits(0, 0));
  EXPECT_EQ(pool.limits().max_concurrent_work, 1U);
  EXPECT_EQ(pool.limits().max_similar_concurrent_work, 1U);
}

TEST(LspWorkPool, StatusNames)
{
  EXPECT_STREQ(miniyaml::lsp::to_string(WorkStatus::Completed), "completed");
  EXPECT_STREQ(miniyaml::lsp::to_string(WorkStatus::TimedOut), "timed out");
  EXPECT_STREQ(miniyaml::lsp::to_string(WorkStatus::Refused), "refused");
  EXPECT_STREQ(miniyaml::lsp::to_string(WorkStatus::Failed), "failed");
}
