#include <medtrust/ledger/storage_ledger.hpp>
#include <medtrust/schema/encoding/scale/encoder.hpp>

#include <spdlog/spdlog.h>

#include <iterator>
#include <optional>
#include <string>
#include <tuple>

namespace medtrust::ledger {

namespace {

using encoder_t = medtrust::schema::encoding::scale_encoder_t;

// (anchored_at, ledger_reference)
using stored_anchor_t =
    std::tuple<medtrust::schema::timestamp_milliseconds_t, std::string>;

medtrust::schema::anchor_error make_unavailable(const std::string& message) {
  return medtrust::schema::anchor_error{
      .code = medtrust::schema::anchor_error_code::ledger_unavailable,
      .message = message};
}

medtrust::schema::bytes_t make_anchor_key(
    const medtrust::schema::hash32_t& hash) {
  auto key = medtrust::schema::make_bytes(kAnchorPrefix);
  key.insert(std::end(key), std::begin(hash), std::end(hash));
  return key;
}

}  // namespace

storage_ledger::storage_ledger(
    std::shared_ptr<medtrust::storage::rocksdb_storage_t> store,
    std::string network,
    medtrust::common::clock_fn_t clock)
    : store_{std::move(store)},
      network_{std::move(network)},
      clock_{std::move(clock)} {}

medtrust::schema::anchor_result_t storage_ledger::anchor_locked(
    const medtrust::schema::hash32_t& hash) {
  auto encoder = encoder_t{};
  auto key = make_anchor_key(hash);
  auto existing = store_->get<stored_anchor_t>(
      encoder, medtrust::schema::bytes_view_t{key});
  if (existing.has_value()) {
    return medtrust::schema::anchor_receipt{
        .hash = hash,
        .anchored_at = std::get<0>(*existing),
        .ledger_reference = std::get<1>(*existing),
        .previously_anchored = true};
  }
  auto anchored_at = clock_();
  auto reference = "0x" + medtrust::schema::to_hex(hash);
  store_->put(encoder, medtrust::schema::bytes_view_t{key},
              stored_anchor_t{anchored_at, reference});
  return medtrust::schema::anchor_receipt{.hash = hash,
                                          .anchored_at = anchored_at,
                                          .ledger_reference = reference,
                                          .previously_anchored = false};
}

medtrust::schema::anchor_result_t storage_ledger::anchor(
    const medtrust::schema::hash32_t& hash) {
  if (!store_) {
    return make_unavailable("local ledger is not open");
  }
  auto lock = std::scoped_lock{mutex_};
  try {
    return anchor_locked(hash);
  } catch (const medtrust::storage::storage_unavailable& e) {
    spdlog::warn("Local ledger anchor failed: {}", e.what());
    return make_unavailable(e.what());
  }
}

medtrust::schema::anchor_query_result_t storage_ledger::is_anchored(
    const medtrust::schema::hash32_t& hash) const {
  if (!store_) {
    return make_unavailable("local ledger is not open");
  }
  auto encoder = encoder_t{};
  auto key = make_anchor_key(hash);
  auto existing = std::optional<stored_anchor_t>{};
  try {
    existing = store_->get<stored_anchor_t>(
        encoder, medtrust::schema::bytes_view_t{key});
  } catch (const medtrust::storage::storage_unavailable& e) {
    spdlog::warn("Local ledger query failed: {}", e.what());
    return make_unavailable(e.what());
  }
  if (!existing.has_value()) {
    return medtrust::schema::anchor_record{.hash = hash, .anchored = false};
  }
  return medtrust::schema::anchor_record{
      .hash = hash,
      .anchored = true,
      .anchored_at = std::get<0>(*existing),
      .ledger_reference = std::get<1>(*existing)};
}

anchor_batch_result_t storage_ledger::anchor_batch(
    const std::vector<medtrust::schema::hash32_t>& hashes) {
  auto results = anchor_batch_result_t{};
  for (const auto& hash : hashes) {
    results.insert_or_assign(hash, anchor(hash));
  }
  spdlog::debug("Local ledger anchored batch of {} hash(es)", hashes.size());
  return results;
}

ledger_info storage_ledger::info() const {
  if (!store_) {
    return ledger_info{.available = false, .network = network_};
  }
  try {
    auto entries = store_->list_by_prefix(
        medtrust::schema::make_bytes_view(kAnchorPrefix));
    return ledger_info{.available = true,
                       .network = network_,
                       .anchored_count = entries.size()};
  } catch (const medtrust::storage::storage_unavailable& e) {
    spdlog::warn("Local ledger info failed: {}", e.what());
    return ledger_info{.available = false, .network = network_};
  }
}

}  // namespace medtrust::ledger
