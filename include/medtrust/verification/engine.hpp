#pragma once
#include <medtrust/common/clock.hpp>
#include <medtrust/ledger/anchor_client.hpp>
#include <medtrust/registry/key_registry.hpp>
#include <medtrust/schema/qr_record.hpp>
#include <medtrust/schema/verification_outcome.hpp>

#include <cstdint>
#include <memory>

namespace medtrust::verification {

/// Classifies scanned QR records.
///
/// Checks, in order of precedence:
///   1. the payload decodes strictly and names the same issuer as the
///      envelope, else counterfeit;
///   2. the signature covers the payload bytes under the embedded key, else
///      counterfeit;
///   3. the key is active for the issuer at `as_of`: revoked is counterfeit,
///      unknown or an unreachable registry is unverified;
///   4. `as_of` falls after the expiry date: expired;
///   5. optionally, the payload hash is anchored on the ledger. This only
///      ever lowers confidence in a verified result.
/// Every check runs and lands in the evidence even when an earlier one has
/// already decided the outcome. Nothing is written and nothing is thrown.
/// A record with an unknown format version is counterfeit.
///
/// If an internal failure interrupts the run, the evidence gathered so far
/// is kept, `internal_error` is set, and the outcome is counterfeit when a
/// completed check already proved it, else unverified.
class engine final {
 public:
  /// Checks in the order `evaluate` runs them.
  enum class stage_t : uint8_t {
    started = 0,
    decoded = 1,
    signature_checked = 2,
    key_checked = 3,
    expiry_checked = 4,
    ledger_checked = 5
  };

  engine(std::shared_ptr<medtrust::registry::key_registry> registry,
         std::shared_ptr<medtrust::ledger::anchor_client> ledger,
         medtrust::common::clock_fn_t clock = medtrust::common::system_clock());

  medtrust::schema::verification_result verify(
      const medtrust::schema::qr_record_t& record,
      medtrust::schema::timestamp_milliseconds_t as_of,
      bool ledger_check) const;

  /// `verify` as of the engine clock.
  medtrust::schema::verification_result verify(
      const medtrust::schema::qr_record_t& record,
      bool ledger_check) const;

 private:
  void evaluate(const medtrust::schema::qr_record_t& record,
                medtrust::schema::timestamp_milliseconds_t as_of,
                bool ledger_check,
                medtrust::schema::verification_result& result,
                stage_t& reached) const;

  std::shared_ptr<medtrust::registry::key_registry> registry_;
  std::shared_ptr<medtrust::ledger::anchor_client> ledger_;
  medtrust::common::clock_fn_t clock_;
};

/// Outcome implied by a fully populated evidence bundle.
medtrust::schema::verification_outcome_t classify(
    const medtrust::schema::verification_evidence& evidence);

/// Outcome of a run interrupted after `reached`: counterfeit only when a
/// completed check proves it, otherwise unverified. Never verified.
medtrust::schema::verification_outcome_t classify_interrupted(
    const medtrust::schema::verification_evidence& evidence,
    engine::stage_t reached);

}  // namespace medtrust::verification
