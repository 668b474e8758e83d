#pragma once
#include <medtrust/schema/key_record.hpp>
#include <medtrust/schema/primitives.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace medtrust::registry {

/// Per-issuer registry row. `mutex` serializes every read and write of the
/// row; `version` increases by one on each state change.
struct issuer_row final {
  std::mutex mutex;
  uint64_t version{};
  std::vector<medtrust::schema::key_record> keys;
};

/// Issuer id -> row. The table lock only guards the map itself and is never
/// held while a row is locked.
class issuer_row_table final {
 public:
  std::shared_ptr<issuer_row> find(
      const medtrust::schema::issuer_id_t& issuer_id) const;
  std::shared_ptr<issuer_row> find_or_create(
      const medtrust::schema::issuer_id_t& issuer_id);
  std::size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<medtrust::schema::issuer_id_t,
                     std::shared_ptr<issuer_row>>
      rows_;
};

/// Status of one key within an issuer's key list.
medtrust::schema::key_status_t status_in(
    const std::vector<medtrust::schema::key_record>& keys,
    const medtrust::schema::public_key_t& public_key,
    medtrust::schema::timestamp_milliseconds_t as_of);

/// Stamp every non-revoked key with `now`. Returns the number of keys that
/// changed.
std::size_t revoke_all(std::vector<medtrust::schema::key_record>& keys,
                       medtrust::schema::timestamp_milliseconds_t now);

std::optional<std::size_t> index_of(
    const std::vector<medtrust::schema::key_record>& keys,
    const medtrust::schema::public_key_t& public_key);

}  // namespace medtrust::registry
