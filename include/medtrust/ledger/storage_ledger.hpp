#pragma once
#include <medtrust/common/clock.hpp>
#include <medtrust/ledger/anchor_client.hpp>
#include <medtrust/storage/rocksdb/storage.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace medtrust::ledger {

/// Local append-only ledger on RocksDB, used by the CLI when no remote
/// ledger is configured. Entries live under `ANCHOR|<hash>` and are never
/// overwritten.
class storage_ledger final : public anchor_client {
 public:
  storage_ledger(
      std::shared_ptr<medtrust::storage::rocksdb_storage_t> store,
      std::string network,
      medtrust::common::clock_fn_t clock = medtrust::common::system_clock());

  medtrust::schema::anchor_result_t anchor(
      const medtrust::schema::hash32_t& hash) override;
  medtrust::schema::anchor_query_result_t is_anchored(
      const medtrust::schema::hash32_t& hash) const override;
  anchor_batch_result_t anchor_batch(
      const std::vector<medtrust::schema::hash32_t>& hashes) override;
  ledger_info info() const override;

 private:
  medtrust::schema::anchor_result_t anchor_locked(
      const medtrust::schema::hash32_t& hash);

  std::shared_ptr<medtrust::storage::rocksdb_storage_t> store_;
  std::string network_;
  medtrust::common::clock_fn_t clock_;
  mutable std::mutex mutex_;
};

inline constexpr auto kAnchorPrefix = std::string_view{"ANCHOR|"};

}  // namespace medtrust::ledger
