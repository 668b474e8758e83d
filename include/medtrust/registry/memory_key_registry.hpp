#pragma once
#include <medtrust/common/clock.hpp>
#include <medtrust/registry/issuer_row.hpp>
#include <medtrust/registry/key_registry.hpp>

#include <atomic>
#include <optional>

namespace medtrust::registry {

/// In-process registry. Used by tests, by embedders that load keys at
/// startup, and as the reference for what durable registries must observe.
class memory_key_registry final : public key_registry {
 public:
  explicit memory_key_registry(
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

  /// Row version for an issuer; std::nullopt when the issuer has no row.
  std::optional<uint64_t> version_of(
      const medtrust::schema::issuer_id_t& issuer_id) const;

  /// Simulate an outage: while unavailable every call raises
  /// `registry_unavailable`.
  void set_available(bool available);

 private:
  void ensure_available() const;

  medtrust::common::clock_fn_t clock_;
  issuer_row_table rows_;
  std::atomic<bool> available_{true};
};

}  // namespace medtrust::registry
