#include <medtrust/ledger/batch_coordinator.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace medtrust::ledger {

batch_coordinator::batch_coordinator(std::shared_ptr<anchor_client> client,
                                     const std::size_t receipt_capacity)
    : client_{std::move(client)},
      receipt_capacity_{std::max<std::size_t>(1, receipt_capacity)} {}

anchor_batch_result_t batch_coordinator::anchor_many(
    const std::set<medtrust::schema::hash32_t>& hashes) {
  auto results = anchor_batch_result_t{};
  auto submit = std::vector<medtrust::schema::hash32_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    for (const auto& hash : hashes) {
      auto known = anchored_.find(hash);
      if (known != std::end(anchored_)) {
        auto receipt = known->second;
        receipt.previously_anchored = true;
        results.insert_or_assign(hash, receipt);
        continue;
      }
      submit.push_back(hash);
    }
  }
  if (submit.empty()) {
    return results;
  }

  auto submitted = client_->anchor_batch(submit);

  auto failures = std::size_t{};
  auto lock = std::scoped_lock{mutex_};
  for (const auto& hash : submit) {
    auto found = submitted.find(hash);
    auto result =
        found != std::end(submitted)
            ? found->second
            : medtrust::schema::anchor_result_t{medtrust::schema::anchor_error{
                  .code =
                      medtrust::schema::anchor_error_code::submission_rejected,
                  .message = "ledger returned no result for hash"}};
    std::visit(
        overloaded{
            [&](const medtrust::schema::anchor_receipt& receipt) {
              remember_locked(receipt);
            },
            [&](const medtrust::schema::anchor_error&) {
              pending_.insert(hash);
              ++failures;
            }},
        result);
    results.insert_or_assign(hash, std::move(result));
  }
  if (failures > 0) {
    spdlog::warn("{} of {} hash(es) failed to anchor; {} pending retry",
                 failures, submit.size(), pending_.size());
  }
  return results;
}

anchor_batch_result_t batch_coordinator::retry_pending() {
  auto retry = std::set<medtrust::schema::hash32_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    retry = pending_;
  }
  if (retry.empty()) {
    return {};
  }
  spdlog::info("Retrying {} pending anchor submission(s)", retry.size());
  return anchor_many(retry);
}

void batch_coordinator::enqueue(const medtrust::schema::hash32_t& hash) {
  auto lock = std::scoped_lock{mutex_};
  if (!anchored_.contains(hash)) {
    pending_.insert(hash);
  }
}

std::vector<medtrust::schema::hash32_t> batch_coordinator::pending() const {
  auto lock = std::scoped_lock{mutex_};
  return {std::begin(pending_), std::end(pending_)};
}

std::optional<medtrust::schema::anchor_receipt>
batch_coordinator::known_receipt(const medtrust::schema::hash32_t& hash) const {
  auto lock = std::scoped_lock{mutex_};
  auto known = anchored_.find(hash);
  if (known == std::end(anchored_)) {
    return std::nullopt;
  }
  return known->second;
}

void batch_coordinator::remember(
    const medtrust::schema::anchor_receipt& receipt) {
  auto lock = std::scoped_lock{mutex_};
  remember_locked(receipt);
}

std::size_t batch_coordinator::known_receipt_count() const {
  auto lock = std::scoped_lock{mutex_};
  return anchored_.size();
}

void batch_coordinator::remember_locked(
    const medtrust::schema::anchor_receipt& receipt) {
  pending_.erase(receipt.hash);
  auto [it, inserted] = anchored_.insert_or_assign(receipt.hash, receipt);
  if (!inserted) {
    return;
  }
  anchored_order_.push_back(receipt.hash);
  while (anchored_.size() > receipt_capacity_) {
    anchored_.erase(anchored_order_.front());
    anchored_order_.pop_front();
  }
}

}  // namespace medtrust::ledger
