#pragma once
#include <medtrust/schema/key_record.hpp>
#include <medtrust/schema/key_status.hpp>
#include <medtrust/schema/primitives.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace medtrust::registry {

/// Raised by registry implementations whose backing store cannot be reached.
/// Callers must fail closed: verification reports unverified, issuance
/// refuses to sign.
class registry_unavailable final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Key registry and revocation oracle.
///
/// Revocation is per issuer and one-way. `revoke` and `status_of` are
/// linearizable for the same issuer; different issuers never contend.
class key_registry {
 public:
  virtual ~key_registry() = default;

  /// Status of `public_key` for `issuer_id` as observed at `as_of`.
  /// `unknown` when the pair was never registered.
  virtual medtrust::schema::key_status_t status_of(
      const medtrust::schema::issuer_id_t& issuer_id,
      const medtrust::schema::public_key_t& public_key,
      medtrust::schema::timestamp_milliseconds_t as_of) const = 0;

  /// Revoke every key currently registered to the issuer, stamped with the
  /// registry clock. Returns true when at least one key changed state;
  /// revoking an already revoked (or unknown) issuer is a no-op.
  virtual bool revoke(const medtrust::schema::issuer_id_t& issuer_id) = 0;

  /// Add an active key. Returns false when the pair is already registered,
  /// in which case nothing changes (a revoked pair stays revoked).
  virtual bool register_key(
      const medtrust::schema::issuer_id_t& issuer_id,
      const medtrust::schema::public_key_t& public_key) = 0;

  virtual std::vector<medtrust::schema::key_record> keys_of(
      const medtrust::schema::issuer_id_t& issuer_id) const = 0;
};

}  // namespace medtrust::registry
