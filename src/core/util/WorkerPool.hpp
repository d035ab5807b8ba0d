#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace safs {

// Fixed set of threads draining a FIFO of jobs. submit() blocks while
// maxQueued jobs are already waiting, so at most threads + maxQueued jobs
// exist at any time.
class WorkerPool {
public:
  explicit WorkerPool(size_t threads, size_t maxQueued = 0);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void submit(std::function<void()> job);

  // Blocks until the queue is empty and no job is running.
  void wait();

  size_t threadCount() const { return workers_.size(); }

private:
  void loop();

  std::vector<std::thread> workers_;
  std::deque<std::function<void()>> queue_;
  std::mutex mu_;
  std::condition_variable hasWork_;
  std::condition_variable hasRoom_;
  std::condition_variable idle_;
  size_t maxQueued_;
  size_t running_ = 0;
  bool stopping_ = false;
};

} // namespace safs
