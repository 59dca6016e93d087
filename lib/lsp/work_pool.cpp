#include "miniyaml/lsp/work_pool.hpp"

#include <algorithm>

namespace miniyaml::lsp
{

const char * to_string(WorkStatus status) noexcept
{
  switch (status) {
    case WorkStatus::Completed:
      return "completed";
    case WorkStatus::TimedOut:
      return "timed out";
    case WorkStatus::Refused:
      return "refused";
    case WorkStatus::Failed:
      return "failed";
  }
  return "unknown";
}

size_t default_max_concurrent_work() noexcept
{
  const unsigned n = std::thread::hardware_concurrency();
  return n == 0 ? 1 : static_cast<size_t>(n);
}

WorkPool::WorkPool(WorkLimits limits) : limits_(limits)
{
  limits_.max_concurrent_work = std::max<size_t>(limits_.max_concurrent_work, 1);
  limits_.max_similar_concurrent_work = std::max<size_t>(limits_.max_similar_concurrent_work, 1);

  workers_.reserve(limits_.max_concurrent_work);
  for (size_t i = 0; i < limits_.max_concurrent_work; ++i) {
    workers_.emplace_back([this] { worker_loop(); });
  }
}

WorkPool::~WorkPool()
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto & t : workers_) {
    if (t.joinable()) {
      t.join();
    }
  }
}

size_t WorkPool::in_flight() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return in_flight_.size();
}

bool WorkPool::admit(const std::string & description)
{
  std::lock_guard<std::mutex> lock(mutex_);

  if (in_flight_.size() >= limits_.max_concurrent_work) {
    // Fail fast so the pool can recover from jobs that overran their timeout.
    spdlog::warn(
      "Refused to start `{}` as we are at work capacity, {} in progress", description,
      in_flight_.size());
    return false;
  }

  const auto similar =
    static_cast<size_t>(std::count(in_flight_.begin(), in_flight_.end(), description));
  if (similar >= limits_.max_similar_concurrent_work) {
    spdlog::info(
      "Refused to start `{}` as same work-type is filling capacity, {} in progress", description,
      similar);
    return false;
  }

  in_flight_.push_back(description);
  return true;
}

void WorkPool::enqueue(std::function<void()> job)
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(job));
  }
  cv_.notify_one();
}

void WorkPool::finish(const std::string & description, Clock::time_point started)
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = std::find(in_flight_.begin(), in_flight_.end(), description);
    if (it != in_flight_.end()) {
      in_flight_.erase(it);
    }
  }

  const auto elapsed = Clock::now() - started;
  if (elapsed >= limits_.request_timeout * 5) {
    const double secs = std::chrono::duration<double>(elapsed).count();
    spdlog::warn("`{}` took {:.1f}s", description, secs);
  }
}

void WorkPool::worker_loop()
{
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) {
        // stopping_ and nothing left to drain
        return;
      }
      job = std::move(queue_.front());
      queue_.pop_front();
    }
    job();
  }
}

}  // namespace miniyaml::lsp
