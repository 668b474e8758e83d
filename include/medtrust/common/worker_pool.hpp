#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace medtrust::common {

/// Fixed set of worker threads fed from a bounded queue.
///
/// `try_submit` never blocks: it refuses work once the queue is full or the
/// pool is shutting down. Destruction drops queued tasks that have not
/// started and joins the workers, so it waits for tasks already running.
class worker_pool final {
 public:
  worker_pool(std::size_t thread_count, std::size_t queue_capacity);
  ~worker_pool();

  worker_pool(const worker_pool&) = delete;
  worker_pool& operator=(const worker_pool&) = delete;

  bool try_submit(std::function<void()> task);

  std::size_t thread_count() const { return workers_.size(); }
  std::size_t queue_capacity() const { return queue_capacity_; }
  /// Tasks waiting for a worker.
  std::size_t queued() const;

 private:
  void run();

  std::size_t queue_capacity_;
  mutable std::mutex mutex_;
  std::condition_variable wake_;
  std::deque<std::function<void()>> tasks_;
  bool stopping_{false};
  std::vector<std::thread> workers_;
};

}  // namespace medtrust::common
