#include <medtrust/ledger/memory_ledger.hpp>

#include <spdlog/spdlog.h>

#include <iterator>
#include <thread>

namespace medtrust::ledger {

memory_ledger::memory_ledger(std::string network,
                             medtrust::common::clock_fn_t clock)
    : network_{std::move(network)}, clock_{std::move(clock)} {}

std::optional<medtrust::schema::anchor_error> memory_ledger::begin_call()
    const {
  ++calls_;
  auto latency = latency_ms_.load();
  if (latency > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds{latency});
  }
  if (!available_.load()) {
    return medtrust::schema::anchor_error{
        .code = medtrust::schema::anchor_error_code::ledger_unavailable,
        .message = "ledger " + network_ + " is unavailable"};
  }
  return std::nullopt;
}

medtrust::schema::anchor_result_t memory_ledger::anchor_locked(
    const medtrust::schema::hash32_t& hash) {
  auto existing = anchored_.find(hash);
  if (existing != std::end(anchored_)) {
    auto receipt = existing->second;
    receipt.previously_anchored = true;
    return receipt;
  }
  if (rejected_.contains(hash)) {
    return medtrust::schema::anchor_error{
        .code = medtrust::schema::anchor_error_code::submission_rejected,
        .message = "ledger rejected submission"};
  }
  auto receipt = medtrust::schema::anchor_receipt{
      .hash = hash,
      .anchored_at = clock_(),
      .ledger_reference = network_ + ":" + std::to_string(next_reference_++),
      .previously_anchored = false};
  anchored_.emplace(hash, receipt);
  return receipt;
}

medtrust::schema::anchor_result_t memory_ledger::anchor(
    const medtrust::schema::hash32_t& hash) {
  if (auto error = begin_call()) {
    return *error;
  }
  auto lock = std::scoped_lock{mutex_};
  return anchor_locked(hash);
}

medtrust::schema::anchor_query_result_t memory_ledger::is_anchored(
    const medtrust::schema::hash32_t& hash) const {
  if (auto error = begin_call()) {
    return *error;
  }
  auto lock = std::scoped_lock{mutex_};
  auto existing = anchored_.find(hash);
  if (existing == std::end(anchored_)) {
    return medtrust::schema::anchor_record{.hash = hash, .anchored = false};
  }
  return medtrust::schema::anchor_record{
      .hash = hash,
      .anchored = true,
      .anchored_at = existing->second.anchored_at,
      .ledger_reference = existing->second.ledger_reference};
}

anchor_batch_result_t memory_ledger::anchor_batch(
    const std::vector<medtrust::schema::hash32_t>& hashes) {
  auto results = anchor_batch_result_t{};
  if (auto error = begin_call()) {
    for (const auto& hash : hashes) {
      results.insert_or_assign(hash, *error);
    }
    return results;
  }
  auto lock = std::scoped_lock{mutex_};
  for (const auto& hash : hashes) {
    results.insert_or_assign(hash, anchor_locked(hash));
  }
  spdlog::debug("Ledger {} anchored batch of {} hash(es)", network_,
                hashes.size());
  return results;
}

ledger_info memory_ledger::info() const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_info{.available = available_.load(),
                     .network = network_,
                     .anchored_count = anchored_.size()};
}

void memory_ledger::set_available(const bool available) {
  available_.store(available);
}

void memory_ledger::set_latency(const std::chrono::milliseconds latency) {
  latency_ms_.store(latency.count());
}

void memory_ledger::reject(const medtrust::schema::hash32_t& hash) {
  auto lock = std::scoped_lock{mutex_};
  rejected_.insert(hash);
}

void memory_ledger::accept(const medtrust::schema::hash32_t& hash) {
  auto lock = std::scoped_lock{mutex_};
  rejected_.erase(hash);
}

uint64_t memory_ledger::call_count() const {
  return calls_.load();
}

}  // namespace medtrust::ledger
