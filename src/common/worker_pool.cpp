#include <medtrust/common/critical.hpp>
#include <medtrust/common/worker_pool.hpp>

#include <spdlog/spdlog.h>

#include <exception>

namespace medtrust::common {

worker_pool::worker_pool(const std::size_t thread_count,
                         const std::size_t queue_capacity)
    : queue_capacity_{queue_capacity} {
  ensure(thread_count > 0, "worker pool requires at least one thread");
  workers_.reserve(thread_count);
  for (auto i = std::size_t{0}; i < thread_count; ++i) {
    workers_.emplace_back([this] { run(); });
  }
}

worker_pool::~worker_pool() {
  {
    auto lock = std::lock_guard{mutex_};
    stopping_ = true;
    if (!tasks_.empty()) {
      spdlog::debug("Worker pool dropping {} queued tasks", tasks_.size());
    }
    tasks_.clear();
  }
  wake_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

bool worker_pool::try_submit(std::function<void()> task) {
  {
    auto lock = std::lock_guard{mutex_};
    if (stopping_ || tasks_.size() >= queue_capacity_) {
      return false;
    }
    tasks_.emplace_back(std::move(task));
  }
  wake_.notify_one();
  return true;
}

std::size_t worker_pool::queued() const {
  auto lock = std::lock_guard{mutex_};
  return tasks_.size();
}

void worker_pool::run() {
  while (true) {
    auto task = std::function<void()>{};
    {
      auto lock = std::unique_lock{mutex_};
      wake_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
      if (stopping_) {
        return;
      }
      task = std::move(tasks_.front());
      tasks_.pop_front();
    }
    try {
      task();
    } catch (const std::exception& e) {
      spdlog::error("Worker task failed: {}", e.what());
    }
  }
}

}  // namespace medtrust::common
