#include "WorkerPool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace safs {

WorkerPool::WorkerPool(size_t threads, size_t maxQueued)
  : maxQueued_(maxQueued == 0 ? std::max<size_t>(threads, 1) : maxQueued) {
  threads = std::max<size_t>(threads, 1);
  workers_.reserve(threads);
  for (size_t i = 0; i < threads; ++i) {
    workers_.emplace_back([this] { loop(); });
  }
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = true;
  }
  hasWork_.notify_all();
  hasRoom_.notify_all();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
}

void WorkerPool::submit(std::function<void()> job) {
  std::unique_lock<std::mutex> lk(mu_);
  hasRoom_.wait(lk, [&] { return stopping_ || queue_.size() < maxQueued_; });
  if (stopping_) return;
  queue_.push_back(std::move(job));
  lk.unlock();
  hasWork_.notify_one();
}

void WorkerPool::wait() {
  std::unique_lock<std::mutex> lk(mu_);
  idle_.wait(lk, [&] { return queue_.empty() && running_ == 0; });
}

void WorkerPool::loop() {
  for (;;) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lk(mu_);
      hasWork_.wait(lk, [&] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) return; // stopping and drained
      job = std::move(queue_.front());
      queue_.pop_front();
      ++running_;
    }
    hasRoom_.notify_one();

    try {
      job();
    } catch (const std::exception& e) {
      // Jobs own their error reporting; this only catches escapes.
      spdlog::error("worker job escaped with exception: {}", e.what());
    }

    {
      std::lock_guard<std::mutex> lk(mu_);
      --running_;
      if (queue_.empty() && running_ == 0) idle_.notify_all();
    }
  }
}

} // namespace safs
