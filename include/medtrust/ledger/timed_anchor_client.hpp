#pragma once
#include <medtrust/common/worker_pool.hpp>
#include <medtrust/ledger/anchor_client.hpp>

#include <chrono>
#include <cstddef>
#include <memory>

namespace medtrust::ledger {

/// Bounds every call to the wrapped client by a deadline. Calls run on a
/// fixed worker pool with a bounded queue.
///
/// A call that misses the deadline reports `ledger_timeout`. If it already
/// started it keeps its worker until the wrapped client returns, and its
/// result is discarded; anchoring is idempotent, so a late-landing
/// submission is harmless. If it was still queued it is skipped. A call that
/// finds the queue full reports `ledger_unavailable` without waiting, so a
/// hung ledger ties up at most `concurrency` threads.
class timed_anchor_client final : public anchor_client {
 public:
  static constexpr auto kDefaultConcurrency = std::size_t{4};
  static constexpr auto kDefaultQueueCapacity = std::size_t{64};

  timed_anchor_client(std::shared_ptr<anchor_client> inner,
                      std::chrono::milliseconds timeout,
                      std::size_t concurrency = kDefaultConcurrency,
                      std::size_t queue_capacity = kDefaultQueueCapacity);

  medtrust::schema::anchor_result_t anchor(
      const medtrust::schema::hash32_t& hash) override;
  medtrust::schema::anchor_query_result_t is_anchored(
      const medtrust::schema::hash32_t& hash) const override;
  anchor_batch_result_t anchor_batch(
      const std::vector<medtrust::schema::hash32_t>& hashes) override;
  ledger_info info() const override;

  std::chrono::milliseconds timeout() const { return timeout_; }
  std::size_t concurrency() const { return pool_.thread_count(); }

 private:
  std::shared_ptr<anchor_client> inner_;
  std::chrono::milliseconds timeout_;
  // Declared last: joined before `inner_` is released.
  mutable medtrust::common::worker_pool pool_;
};

}  // namespace medtrust::ledger
