#pragma once
#include <medtrust/common/clock.hpp>
#include <medtrust/crypto/keys.hpp>
#include <medtrust/issuance/anchor_dispatcher.hpp>
#include <medtrust/ledger/anchor_client.hpp>
#include <medtrust/ledger/batch_coordinator.hpp>
#include <medtrust/registry/key_registry.hpp>
#include <medtrust/schema/anchor_mode.hpp>
#include <medtrust/schema/canonical_payload.hpp>
#include <medtrust/schema/issuance_error.hpp>
#include <medtrust/schema/qr_record.hpp>

#include <memory>
#include <optional>
#include <variant>

namespace medtrust::issuance {

using sign_result_t =
    std::variant<medtrust::schema::qr_record_t, medtrust::schema::issuance_error>;

/// Issues signed QR records.
///
/// Signing reads the registry once and never writes it. With anchoring
/// enabled the payload hash is submitted to the ledger; a failed submission
/// never fails issuance, the hash is queued for retry instead.
class signing_service final {
 public:
  signing_service(std::shared_ptr<medtrust::registry::key_registry> registry,
                  std::shared_ptr<medtrust::ledger::anchor_client> ledger,
                  medtrust::schema::anchor_mode_t mode,
                  medtrust::common::clock_fn_t clock =
                      medtrust::common::system_clock());

  /// Validate `payload`, confirm `key` is an active key of the payload's
  /// issuer, and sign the canonical bytes.
  sign_result_t sign(const medtrust::schema::canonical_payload_t& payload,
                     const medtrust::crypto::private_key& key);

  /// Non-blocking anchoring state for a payload hash. std::nullopt while a
  /// background submission is still pending or when nothing was submitted.
  std::optional<medtrust::schema::anchor_result_t> anchor_status(
      const medtrust::schema::hash32_t& hash) const;

  /// Copy of `record` carrying the anchor receipt, once one is known.
  medtrust::schema::qr_record_t attach_anchor(
      const medtrust::schema::qr_record_t& record) const;

  /// Wait for background submissions to finish.
  void drain();

  /// Resubmit hashes whose anchoring failed.
  medtrust::ledger::anchor_batch_result_t retry_pending();

  medtrust::schema::anchor_mode_t mode() const { return mode_; }
  /// Null when anchoring is disabled.
  std::shared_ptr<medtrust::ledger::batch_coordinator> coordinator() const {
    return coordinator_;
  }

 private:
  std::shared_ptr<medtrust::registry::key_registry> registry_;
  std::shared_ptr<medtrust::ledger::anchor_client> ledger_;
  medtrust::schema::anchor_mode_t mode_;
  medtrust::common::clock_fn_t clock_;
  std::shared_ptr<medtrust::ledger::batch_coordinator> coordinator_;
  std::unique_ptr<anchor_dispatcher> dispatcher_;
};

}  // namespace medtrust::issuance
