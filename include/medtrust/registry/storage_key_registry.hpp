#pragma once
#include <medtrust/common/clock.hpp>
#include <medtrust/registry/issuer_row.hpp>
#include <medtrust/registry/key_registry.hpp>
#include <medtrust/storage/rocksdb/storage.hpp>

#include <cstddef>
#include <memory>
#include <string_view>

namespace medtrust::registry {

/// Durable registry on RocksDB. Each key record lives under
/// `REG|KEY|<issuer>|<public key>`; reads always go to the store. Writes for
/// one issuer are serialized through that issuer's row lock and committed as
/// a single batch, so a reader sees a write entirely or not at all. Rows are
/// only created by writes. A store that fails to read or write surfaces as
/// `registry_unavailable`.
class storage_key_registry final : public key_registry {
 public:
  storage_key_registry(
      std::shared_ptr<medtrust::storage::rocksdb_storage_t> store,
      medtrust::common::clock_fn_t clock = medtrust::common::system_clock());

  medtrust::schema::key_status_t status_of(
      const medtrust::schema::issuer_id_t& issuer_id,
      const medtrust::schema::public_key_t& public_key,
      medtrust::schema::timestamp_milliseconds_t as_of) const override;
  bool revoke(const medtrust::schema::issuer_id_t& issuer_id) override;
  bool register_key(const medtrust::schema::issuer_id_t& issuer_id,
                    const medtrust::schema::public_key_t& public_key) override;
  std::vector<medtrust::schema::key_record> keys_of(
      const medtrust::schema::issuer_id_t& issuer_id) const override;

  /// Issuers with an in-memory row lock.
  std::size_t tracked_issuers() const { return rows_.size(); }

 private:
  std::vector<medtrust::schema::key_record> load(
      const medtrust::schema::issuer_id_t& issuer_id) const;
  void store(const std::vector<medtrust::schema::key_record>& records) const;

  std::shared_ptr<medtrust::storage::rocksdb_storage_t> store_;
  medtrust::common::clock_fn_t clock_;
  issuer_row_table rows_;
};

inline constexpr auto kKeyRecordPrefix = std::string_view{"REG|KEY|"};

}  // namespace medtrust::registry
