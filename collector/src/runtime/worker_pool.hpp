#pragma once
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace fleetinv {
namespace collector {

// Fixed-size FIFO thread pool. The destructor drains queued work and joins.
class WorkerPool {
 public:
  explicit WorkerPool(int concurrency) : concurrency_(concurrency < 1 ? 1 : concurrency), stop_(false) {
    threads_.reserve(static_cast<size_t>(concurrency_));
    for (int i = 0; i < concurrency_; ++i) {
      threads_.emplace_back([this]() { this->run(); });
    }
  }
  ~WorkerPool() {
    {
      std::unique_lock<std::mutex> lk(mu_);
      stop_ = true;
    }
    cv_.notify_all();
    for (auto &t : threads_) t.join();
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // The future carries the result or the exception thrown by fn
  template <typename F>
  auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using R = std::invoke_result_t<std::decay_t<F>>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    std::future<R> fut = task->get_future();
    {
      std::unique_lock<std::mutex> lk(mu_);
      q_.push([task]() { (*task)(); });
    }
    cv_.notify_one();
    return fut;
  }

  size_t queue_depth() const {
    std::unique_lock<std::mutex> lk(mu_);
    return q_.size();
  }

  int size() const { return concurrency_; }

 private:
  using Task = std::function<void()>;

  void run() {
    while (true) {
      Task task;
      {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [this]{ return stop_ || !q_.empty(); });
        if (stop_ && q_.empty()) return;
        task = std::move(q_.front());
        q_.pop();
      }
      // packaged_task stores any exception in the shared state
      task();
    }
  }

  int concurrency_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::queue<Task> q_;
  bool stop_;
  std::vector<std::thread> threads_;
};

} // namespace collector
} // namespace fleetinv
