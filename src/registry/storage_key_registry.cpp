#include <medtrust/common/critical.hpp>
#include <medtrust/registry/storage_key_registry.hpp>
#include <medtrust/schema/encoding/scale/encoder.hpp>

#include <spdlog/spdlog.h>

#include <iterator>
#include <optional>
#include <tuple>

namespace medtrust::registry {

namespace {

using encoder_t = medtrust::schema::encoding::scale_encoder_t;

using stored_key_record_t =
    std::tuple<medtrust::schema::issuer_id_t,
               medtrust::schema::public_key_t,
               medtrust::schema::timestamp_milliseconds_t,
               std::optional<medtrust::schema::timestamp_milliseconds_t>>;

medtrust::schema::bytes_t make_issuer_prefix(
    const medtrust::schema::issuer_id_t& issuer_id) {
  auto encoder = encoder_t{};
  auto prefix = medtrust::schema::make_bytes(kKeyRecordPrefix);
  // Length-prefixed issuer id, so no issuer's prefix is a prefix of another's.
  encoder.encode(issuer_id, prefix);
  prefix.push_back('|');
  return prefix;
}

medtrust::schema::bytes_t make_record_key(
    const medtrust::schema::issuer_id_t& issuer_id,
    const medtrust::schema::public_key_t& public_key) {
  auto key = make_issuer_prefix(issuer_id);
  key.insert(std::end(key), std::begin(public_key), std::end(public_key));
  return key;
}

}  // namespace

storage_key_registry::storage_key_registry(
    std::shared_ptr<medtrust::storage::rocksdb_storage_t> store,
    medtrust::common::clock_fn_t clock)
    : store_{std::move(store)}, clock_{std::move(clock)} {
  if (!store_) {
    throw registry_unavailable{"key registry storage is not open"};
  }
}

std::vector<medtrust::schema::key_record> storage_key_registry::load(
    const medtrust::schema::issuer_id_t& issuer_id) const {
  auto encoder = encoder_t{};
  auto records = std::vector<medtrust::schema::key_record>{};
  auto prefix = make_issuer_prefix(issuer_id);
  auto entries = std::vector<medtrust::storage::key_value_entry_t>{};
  try {
    entries = store_->list_by_prefix(medtrust::schema::bytes_view_t{prefix});
  } catch (const medtrust::storage::storage_unavailable& e) {
    throw registry_unavailable{e.what()};
  }
  for (const auto& [key, value] : entries) {
    auto decoded = encoder.try_decode<stored_key_record_t>(
        medtrust::schema::bytes_view_t{value});
    if (!decoded.has_value()) {
      medtrust::common::critical("corrupt key record in registry storage");
    }
    auto& [stored_issuer, public_key, registered_at, revoked_at] = *decoded;
    records.push_back(medtrust::schema::key_record{
        .issuer_id = std::move(stored_issuer),
        .public_key = public_key,
        .registered_at = registered_at,
        .revoked_at = revoked_at});
  }
  return records;
}

void storage_key_registry::store(
    const std::vector<medtrust::schema::key_record>& records) const {
  auto encoder = encoder_t{};
  auto entries = std::vector<medtrust::storage::key_value_entry_t>{};
  entries.reserve(records.size());
  for (const auto& record : records) {
    entries.emplace_back(
        make_record_key(record.issuer_id, record.public_key),
        encoder.encode(stored_key_record_t{record.issuer_id, record.public_key,
                                           record.registered_at,
                                           record.revoked_at}));
  }
  try {
    store_->put_batch(entries);
  } catch (const medtrust::storage::storage_unavailable& e) {
    throw registry_unavailable{e.what()};
  }
}

medtrust::schema::key_status_t storage_key_registry::status_of(
    const medtrust::schema::issuer_id_t& issuer_id,
    const medtrust::schema::public_key_t& public_key,
    const medtrust::schema::timestamp_milliseconds_t as_of) const {
  auto row = rows_.find(issuer_id);
  if (!row) {
    return status_in(load(issuer_id), public_key, as_of);
  }
  auto lock = std::scoped_lock{row->mutex};
  return status_in(load(issuer_id), public_key, as_of);
}

bool storage_key_registry::revoke(
    const medtrust::schema::issuer_id_t& issuer_id) {
  auto row = rows_.find_or_create(issuer_id);
  auto lock = std::scoped_lock{row->mutex};
  auto records = load(issuer_id);
  auto changed = revoke_all(records, clock_());
  if (changed == 0) {
    spdlog::info("Revoke of issuer '{}' changed nothing", issuer_id);
    return false;
  }
  store(records);
  ++row->version;
  spdlog::info("Revoked {} key(s) of issuer '{}'", changed, issuer_id);
  return true;
}

bool storage_key_registry::register_key(
    const medtrust::schema::issuer_id_t& issuer_id,
    const medtrust::schema::public_key_t& public_key) {
  auto row = rows_.find_or_create(issuer_id);
  auto lock = std::scoped_lock{row->mutex};
  if (index_of(load(issuer_id), public_key).has_value()) {
    return false;
  }
  store({medtrust::schema::key_record{.issuer_id = issuer_id,
                                      .public_key = public_key,
                                      .registered_at = clock_(),
                                      .revoked_at = std::nullopt}});
  ++row->version;
  spdlog::info("Registered key {} for issuer '{}'",
               medtrust::schema::to_hex(public_key), issuer_id);
  return true;
}

std::vector<medtrust::schema::key_record> storage_key_registry::keys_of(
    const medtrust::schema::issuer_id_t& issuer_id) const {
  auto row = rows_.find(issuer_id);
  if (!row) {
    return load(issuer_id);
  }
  auto lock = std::scoped_lock{row->mutex};
  return load(issuer_id);
}

}  // namespace medtrust::registry
