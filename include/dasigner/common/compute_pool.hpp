#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace dasigner {

// Fixed-size worker pool for CPU-bound work. Kept separate from the threads
// that call into the signer so slow verification never blocks request intake.
class ComputePool {
 public:
  explicit ComputePool(size_t worker_count) {
    if (worker_count == 0) {
      throw std::invalid_argument("ComputePool worker_count must be > 0");
    }

    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
      workers_.emplace_back([this]() { RunWorker(); });
    }
  }

  ~ComputePool() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      shutting_down_ = true;
    }
    cv_.notify_all();
    for (std::thread& worker : workers_) {
      if (worker.joinable()) {
        worker.join();
      }
    }
  }

  ComputePool(const ComputePool&) = delete;
  ComputePool& operator=(const ComputePool&) = delete;
  ComputePool(ComputePool&&) = delete;
  ComputePool& operator=(ComputePool&&) = delete;

  // Uses `configured` when set and non-zero, hardware concurrency otherwise.
  static size_t ResolveWorkerCount(std::optional<size_t> configured) {
    if (configured.has_value() && *configured > 0) {
      return *configured;
    }
    const unsigned int hw = std::thread::hardware_concurrency();
    return std::max<size_t>(1, hw);
  }

  size_t worker_count() const {
    return workers_.size();
  }

  template <typename Fn>
  auto Submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
    using Result = std::invoke_result_t<Fn>;

    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    std::future<Result> future = task->get_future();
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (shutting_down_) {
        throw std::runtime_error("cannot submit task to a stopped ComputePool");
      }
      pending_.push_back([task]() { (*task)(); });
    }
    cv_.notify_one();
    return future;
  }

  // Runs fn(i) for every i in [0, count) on the pool and returns the results
  // in index order. Rethrows the exception of the lowest failing index.
  template <typename Fn>
  auto MapIndexed(size_t count, Fn fn) -> std::vector<std::invoke_result_t<Fn, size_t>> {
    using Result = std::invoke_result_t<Fn, size_t>;

    std::vector<std::future<Result>> futures;
    futures.reserve(count);
    for (size_t i = 0; i < count; ++i) {
      futures.push_back(Submit([fn, i]() { return fn(i); }));
    }

    // Wait for every task before surfacing an error: tasks hold references
    // into the caller's frame.
    for (std::future<Result>& future : futures) {
      future.wait();
    }

    std::vector<Result> results;
    results.reserve(count);
    for (std::future<Result>& future : futures) {
      results.push_back(future.get());
    }
    return results;
  }

 private:
  void RunWorker() {
    while (true) {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this]() { return shutting_down_ || !pending_.empty(); });
        if (shutting_down_ && pending_.empty()) {
          return;
        }
        task = std::move(pending_.front());
        pending_.pop_front();
      }
      task();
    }
  }

  std::vector<std::thread> workers_;
  std::deque<std::function<void()>> pending_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool shutting_down_ = false;
};

}  // namespace dasigner
