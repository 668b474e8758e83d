#pragma once
#include <medtrust/schema/key_status.hpp>
#include <medtrust/schema/primitives.hpp>

#include <optional>

// Schema type: key record.
// One registered issuer key. Status moves active -> revoked only; a revoked
// issuer comes back by registering a new key.
namespace medtrust::schema {

struct key_record final {
  issuer_id_t issuer_id;
  public_key_t public_key{};
  timestamp_milliseconds_t registered_at{};
  std::optional<timestamp_milliseconds_t> revoked_at;

  /// Status as observed at `as_of`. Revocation covers every instant at or
  /// after `revoked_at`.
  key_status_t status_at(const timestamp_milliseconds_t as_of) const {
    if (revoked_at.has_value() && as_of >= *revoked_at) {
      return key_status_t::revoked;
    }
    return key_status_t::active;
  }

  /// Current lifecycle state, independent of any as-of time.
  key_status_t status() const {
    return revoked_at.has_value() ? key_status_t::revoked
                                  : key_status_t::active;
  }
};

}  // namespace medtrust::schema
