#pragma once
#include <medtrust/ledger/anchor_client.hpp>

#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace medtrust::ledger {

/// Groups pending payload hashes into single ledger submissions and keeps
/// the set of hashes whose anchoring failed for later retry.
///
/// Known receipts are a local cache of at most `receipt_capacity` entries;
/// the oldest is forgotten first. A forgotten hash is simply asked of the
/// ledger again, which answers idempotently.
class batch_coordinator final {
 public:
  static constexpr auto kDefaultReceiptCapacity = std::size_t{4096};

  explicit batch_coordinator(
      std::shared_ptr<anchor_client> client,
      std::size_t receipt_capacity = kDefaultReceiptCapacity);

  /// Anchor every hash in `hashes`. Hashes this coordinator already saw
  /// anchored are answered locally; the rest go to the ledger in one
  /// `anchor_batch` call. Failed hashes are queued for `retry_pending`.
  anchor_batch_result_t anchor_many(
      const std::set<medtrust::schema::hash32_t>& hashes);

  /// Resubmit exactly the queued failures. Hashes that succeed leave the
  /// queue; the rest stay.
  anchor_batch_result_t retry_pending();

  /// Queue a hash whose anchoring failed elsewhere (e.g. during signing).
  void enqueue(const medtrust::schema::hash32_t& hash);

  std::vector<medtrust::schema::hash32_t> pending() const;

  /// Receipt from a previous successful anchoring seen by this coordinator.
  std::optional<medtrust::schema::anchor_receipt> known_receipt(
      const medtrust::schema::hash32_t& hash) const;

  /// Record a receipt obtained outside the coordinator.
  void remember(const medtrust::schema::anchor_receipt& receipt);

  std::size_t known_receipt_count() const;

 private:
  void remember_locked(const medtrust::schema::anchor_receipt& receipt);

  std::shared_ptr<anchor_client> client_;
  std::size_t receipt_capacity_;

  mutable std::mutex mutex_;
  std::map<medtrust::schema::hash32_t, medtrust::schema::anchor_receipt>
      anchored_;
  // Insertion order of `anchored_`, oldest first.
  std::deque<medtrust::schema::hash32_t> anchored_order_;
  std::set<medtrust::schema::hash32_t> pending_;
};

}  // namespace medtrust::ledger
