// miniyaml/lsp/work_pool.hpp - Bounded worker threads for read-only requests
//
// Requests run on a fixed set of worker threads. Admission is decided when a
// job is submitted: a job is refused when the pool already has
// `max_concurrent_work` jobs in flight, or `max_similar_concurrent_work` jobs
// with the same description. A job that only starts after its request has
// already waited `request_timeout` yields its fallback value instead of running.
//
#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace miniyaml::lsp
{

enum class WorkStatus {
  Completed,
  TimedOut,
  Refused,
  Failed,
};

[[nodiscard]] const char * to_string(WorkStatus status) noexcept;

/// Hardware concurrency, at least 1.
[[nodiscard]] size_t default_max_concurrent_work() noexcept;

struct WorkLimits
{
  std::chrono::milliseconds request_timeout{1500};
  size_t max_similar_concurrent_work = 2;
  size_t max_concurrent_work = default_max_concurrent_work();
};

template <typename T>
struct WorkResult
{
  WorkStatus status = WorkStatus::Completed;
  T value;
  std::string error;  // set for Failed
};

class WorkPool
{
public:
  using Clock = std::chrono::steady_clock;

  explicit WorkPool(WorkLimits limits = {});
  ~WorkPool();

  WorkPool(const WorkPool &) = delete;
  WorkPool & operator=(const WorkPool &) = delete;

  [[nodiscard]] const WorkLimits & limits() const noexcept { return limits_; }

  /// Jobs admitted and not yet finished.
  [[nodiscard]] size_t in_flight() const;

  /**
   * Queue `work` for a worker thread and hand the result to `on_done`.
   *
   * @param description  Kind of work (e.g. the request method); equal
   *                     descriptions count against the same per-kind limit.
   * @param received_at  When the originating request arrived.
   * @param fallback     Value reported when the job is refused, times out or
   *                     fails.
   * @param on_done      Called exactly once: on the submitting thread when the
   *                     job is refused, otherwise on the worker thread after the
   *                     job has left the in-flight set.
   */
  template <typename T>
  void submit(
    const std::string & description, Clock::time_point received_at, std::function<T()> work,
    T fallback, std::function<void(WorkResult<T>)> on_done)
  {
    if (!admit(description)) {
      deliver(description, on_done, WorkResult<T>{WorkStatus::Refused, std::move(fallback), {}});
      return;
    }

    enqueue([this, description, received_at, work = std::move(work),
             fallback = std::move(fallback), on_done = std::move(on_done)]() mutable {
      const Clock::time_point started = Clock::now();
      WorkResult<T> result{WorkStatus::Completed, fallback, {}};

      if (started - received_at >= limits_.request_timeout) {
        spdlog::debug("`{}` timed out before it started", description);
        result.status = WorkStatus::TimedOut;
      } else {
        try {
          result.value = work();
        } catch (const std::exception & e) {
          spdlog::error("`{}` failed: {}", description, e.what());
          result = WorkResult<T>{WorkStatus::Failed, std::move(fallback), e.what()};
        } catch (...) {
          spdlog::error("`{}` failed with a non-standard exception", description);
          result = WorkResult<T>{WorkStatus::Failed, std::move(fallback), "unknown error"};
        }
      }

      finish(description, started);
      deliver(description, on_done, std::move(result));
    });
  }

  /// As above, with the result delivered through a future.
  template <typename T>
  [[nodiscard]] std::future<WorkResult<T>> submit(
    const std::string & description, Clock::time_point received_at, std::function<T()> work,
    T fallback)
  {
    auto promise = std::make_shared<std::promise<WorkResult<T>>>();
    std::future<WorkResult<T>> future = promise->get_future();
    submit<T>(
      description, received_at, std::move(work), std::move(fallback),
      [promise](WorkResult<T> result) { promise->set_value(std::move(result)); });
    return future;
  }

private:
  [[nodiscard]] bool admit(const std::string & description);
  void enqueue(std::function<void()> job);
  void finish(const std::string & description, Clock::time_point started);
  void worker_loop();

  template <typename T>
  static void deliver(
    const std::string & description, const std::function<void(WorkResult<T>)> & on_done,
    WorkResult<T> result)
  {
    if (!on_done) {
      return;
    }
    try {
      on_done(std::move(result));
    } catch (const std::exception & e) {
      spdlog::error("completion of `{}` failed: {}", description, e.what());
    }
  }

  WorkLimits limits_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> queue_;
  std::vector<std::string> in_flight_;
  bool stopping_ = false;

  std::vector<std::thread> workers_;
};

}  // namespace miniyaml::lsp
