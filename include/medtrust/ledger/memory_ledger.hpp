#pragma once
#include <medtrust/common/clock.hpp>
#include <medtrust/ledger/anchor_client.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace medtrust::ledger {

/// In-memory append-only ledger with fault injection for tests: toggle
/// availability, reject chosen hashes, and add per-call latency.
class memory_ledger final : public anchor_client {
 public:
  explicit memory_ledger(
      std::string network = "memory",
      medtrust::common::clock_fn_t clock = medtrust::common::system_clock());

  medtrust::schema::anchor_result_t anchor(
      const medtrust::schema::hash32_t& hash) override;
  medtrust::schema::anchor_query_result_t is_anchored(
      const medtrust::schema::hash32_t& hash) const override;
  anchor_batch_result_t anchor_batch(
      const std::vector<medtrust::schema::hash32_t>& hashes) override;
  ledger_info info() const override;

  void set_available(bool available);
  void set_latency(std::chrono::milliseconds latency);
  void reject(const medtrust::schema::hash32_t& hash);
  void accept(const medtrust::schema::hash32_t& hash);

  /// Number of ledger round trips served (single or batch).
  uint64_t call_count() const;

 private:
  medtrust::schema::anchor_result_t anchor_locked(
      const medtrust::schema::hash32_t& hash);
  std::optional<medtrust::schema::anchor_error> begin_call() const;

  std::string network_;
  medtrust::common::clock_fn_t clock_;

  mutable std::mutex mutex_;
  std::map<medtrust::schema::hash32_t, medtrust::schema::anchor_receipt>
      anchored_;
  std::set<medtrust::schema::hash32_t> rejected_;
  uint64_t next_reference_{1};

  std::atomic<bool> available_{true};
  std::atomic<int64_t> latency_ms_{0};
  mutable std::atomic<uint64_t> calls_{0};
};

}  // namespace medtrust::ledger
