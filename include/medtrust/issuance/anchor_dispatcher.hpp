#pragma once
#include <medtrust/ledger/anchor_client.hpp>
#include <medtrust/ledger/batch_coordinator.hpp>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace medtrust::issuance {

/// Background anchoring for asynchronous issuance.
///
/// `submit` only enqueues. Workers call the ledger and record each outcome:
/// receipts are remembered by the coordinator, failures are queued there for
/// retry. Only the latest `result_capacity` outcomes are kept for `status`.
/// The destructor finishes queued work before joining.
class anchor_dispatcher final {
 public:
  static constexpr auto kDefaultResultCapacity = std::size_t{4096};

  anchor_dispatcher(std::shared_ptr<medtrust::ledger::anchor_client> client,
                    std::shared_ptr<medtrust::ledger::batch_coordinator>
                        coordinator,
                    std::size_t worker_count = 1,
                    std::size_t result_capacity = kDefaultResultCapacity);
  ~anchor_dispatcher();

  anchor_dispatcher(const anchor_dispatcher&) = delete;
  anchor_dispatcher& operator=(const anchor_dispatcher&) = delete;

  void submit(const medtrust::schema::hash32_t& hash);

  /// Latest outcome for a submitted hash; std::nullopt while it is still
  /// queued or in flight, once it has aged out, or when it was never
  /// submitted here.
  std::optional<medtrust::schema::anchor_result_t> status(
      const medtrust::schema::hash32_t& hash) const;

  std::size_t retained_results() const;

  /// Block until every submitted hash has an outcome.
  void drain();

 private:
  void run();

  std::shared_ptr<medtrust::ledger::anchor_client> client_;
  std::shared_ptr<medtrust::ledger::batch_coordinator> coordinator_;

  mutable std::mutex mutex_;
  std::condition_variable work_available_;
  std::condition_variable idle_;
  std::deque<medtrust::schema::hash32_t> queue_;
  std::size_t in_flight_{};
  bool stop_{false};
  std::size_t result_capacity_;
  std::map<medtrust::schema::hash32_t, medtrust::schema::anchor_result_t>
      results_;
  // Insertion order of `results_`, oldest first.
  std::deque<medtrust::schema::hash32_t> results_order_;
  std::vector<std::thread> workers_;
};

}  // namespace medtrust::issuance
