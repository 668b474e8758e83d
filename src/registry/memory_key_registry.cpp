#include <medtrust/registry/memory_key_registry.hpp>

#include <spdlog/spdlog.h>

namespace medtrust::registry {

memory_key_registry::memory_key_registry(medtrust::common::clock_fn_t clock)
    : clock_{std::move(clock)} {}

void memory_key_registry::ensure_available() const {
  if (!available_.load()) {
    throw registry_unavailable{"key registry is unavailable"};
  }
}

void memory_key_registry::set_available(const bool available) {
  available_.store(available);
}

medtrust::schema::key_status_t memory_key_registry::status_of(
    const medtrust::schema::issuer_id_t& issuer_id,
    const medtrust::schema::public_key_t& public_key,
    const medtrust::schema::timestamp_milliseconds_t as_of) const {
  ensure_available();
  auto row = rows_.find(issuer_id);
  if (!row) {
    return medtrust::schema::key_status_t::unknown;
  }
  auto lock = std::scoped_lock{row->mutex};
  return status_in(row->keys, public_key, as_of);
}

bool memory_key_registry::revoke(
    const medtrust::schema::issuer_id_t& issuer_id) {
  ensure_available();
  auto row = rows_.find(issuer_id);
  if (!row) {
    spdlog::info("Revoke ignored for unknown issuer '{}'", issuer_id);
    return false;
  }
  auto lock = std::scoped_lock{row->mutex};
  auto changed = revoke_all(row->keys, clock_());
  if (changed == 0) {
    return false;
  }
  ++row->version;
  spdlog::info("Revoked {} key(s) of issuer '{}'", changed, issuer_id);
  return true;
}

bool memory_key_registry::register_key(
    const medtrust::schema::issuer_id_t& issuer_id,
    const medtrust::schema::public_key_t& public_key) {
  ensure_available();
  auto row = rows_.find_or_create(issuer_id);
  auto lock = std::scoped_lock{row->mutex};
  if (index_of(row->keys, public_key).has_value()) {
    return false;
  }
  row->keys.push_back(medtrust::schema::key_record{
      .issuer_id = issuer_id,
      .public_key = public_key,
      .registered_at = clock_(),
      .revoked_at = std::nullopt});
  ++row->version;
  spdlog::debug("Registered key {} for issuer '{}'",
                medtrust::schema::to_hex(public_key), issuer_id);
  return true;
}

std::vector<medtrust::schema::key_record> memory_key_registry::keys_of(
    const medtrust::schema::issuer_id_t& issuer_id) const {
  ensure_available();
  auto row = rows_.find(issuer_id);
  if (!row) {
    return {};
  }
  auto lock = std::scoped_lock{row->mutex};
  return row->keys;
}

std::optional<uint64_t> memory_key_registry::version_of(
    const medtrust::schema::issuer_id_t& issuer_id) const {
  auto row = rows_.find(issuer_id);
  if (!row) {
    return std::nullopt;
  }
  auto lock = std::scoped_lock{row->mutex};
  return row->version;
}

}  // namespace medtrust::registry
