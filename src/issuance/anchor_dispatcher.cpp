#include <medtrust/issuance/anchor_dispatcher.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace medtrust::issuance {

anchor_dispatcher::anchor_dispatcher(
    std::shared_ptr<medtrust::ledger::anchor_client> client,
    std::shared_ptr<medtrust::ledger::batch_coordinator> coordinator,
    std::size_t worker_count,
    const std::size_t result_capacity)
    : client_{std::move(client)},
      coordinator_{std::move(coordinator)},
      result_capacity_{std::max<std::size_t>(1, result_capacity)} {
  worker_count = std::max<std::size_t>(1, worker_count);
  workers_.reserve(worker_count);
  for (auto i = std::size_t{}; i < worker_count; ++i) {
    workers_.emplace_back([this] { run(); });
  }
}

anchor_dispatcher::~anchor_dispatcher() {
  {
    auto lock = std::unique_lock{mutex_};
    stop_ = true;
  }
  work_available_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

void anchor_dispatcher::submit(const medtrust::schema::hash32_t& hash) {
  {
    auto lock = std::unique_lock{mutex_};
    if (results_.erase(hash) > 0) {
      std::erase(results_order_, hash);
    }
    queue_.push_back(hash);
  }
  work_available_.notify_one();
}

std::optional<medtrust::schema::anchor_result_t> anchor_dispatcher::status(
    const medtrust::schema::hash32_t& hash) const {
  auto lock = std::unique_lock{mutex_};
  auto found = results_.find(hash);
  if (found == std::end(results_)) {
    return std::nullopt;
  }
  return found->second;
}

std::size_t anchor_dispatcher::retained_results() const {
  auto lock = std::unique_lock{mutex_};
  return results_.size();
}

void anchor_dispatcher::drain() {
  auto lock = std::unique_lock{mutex_};
  idle_.wait(lock, [this] { return queue_.empty() && in_flight_ == 0; });
}

void anchor_dispatcher::run() {
  while (true) {
    auto hash = medtrust::schema::hash32_t{};
    {
      auto lock = std::unique_lock{mutex_};
      work_available_.wait(lock, [this] { return !queue_.empty() || stop_; });
      if (stop_ && queue_.empty()) {
        return;
      }
      hash = queue_.front();
      queue_.pop_front();
      ++in_flight_;
    }

    auto result = client_->anchor(hash);
    std::visit(
        overloaded{
            [&](const medtrust::schema::anchor_receipt& receipt) {
              coordinator_->remember(receipt);
            },
            [&](const medtrust::schema::anchor_error& error) {
              spdlog::warn("Background anchoring of {} failed ({}): {}",
                           medtrust::schema::to_hex(hash),
                           medtrust::schema::to_string(error.code),
                           error.message);
              coordinator_->enqueue(hash);
            }},
        result);

    {
      auto lock = std::unique_lock{mutex_};
      auto [it, inserted] = results_.insert_or_assign(hash, std::move(result));
      if (inserted) {
        results_order_.push_back(hash);
      }
      while (results_.size() > result_capacity_) {
        results_.erase(results_order_.front());
        results_order_.pop_front();
      }
      --in_flight_;
    }
    idle_.notify_all();
  }
}

}  // namespace medtrust::issuance
