#pragma once
#include <medtrust/audit/audit_sink.hpp>
#include <medtrust/common/clock.hpp>
#include <medtrust/issuance/signing_service.hpp>
#include <medtrust/schema/issuance_error.hpp>
#include <medtrust/schema/qr_record.hpp>
#include <medtrust/schema/verification_outcome.hpp>
#include <medtrust/service/key_store.hpp>
#include <medtrust/verification/engine.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace medtrust::service {

/// Unvalidated medicine-unit fields as received from an issuer. Dates are
/// `YYYY-MM-DD` text.
struct payload_fields final {
  std::string medicine_id;
  std::string batch_number;
  std::string manufacture_date;
  std::string expiry_date;
  std::string issuer_id;
  uint64_t sequence{};
};

struct issued_record final {
  medtrust::schema::qr_record_t record;
  // Text handed to the QR image renderer.
  std::string qr_text;
  medtrust::schema::hash32_t payload_hash{};
};

using signing_response_t =
    std::variant<issued_record, medtrust::schema::issuance_error>;

/// Entry points for issuers and scanners. Every call emits exactly one
/// audit event.
class authenticator final {
 public:
  authenticator(std::shared_ptr<medtrust::issuance::signing_service> signer,
                std::shared_ptr<medtrust::verification::engine> verifier,
                std::shared_ptr<key_store> keys,
                std::shared_ptr<medtrust::audit::audit_sink> audit,
                medtrust::common::clock_fn_t clock =
                    medtrust::common::system_clock());

  /// Sign `fields` with the key behind `key_reference`. The reference must
  /// belong to the payload's issuer.
  signing_response_t request_signing(const payload_fields& fields,
                                     std::string_view key_reference);

  /// Verify separately transported record parts. Malformed parts classify
  /// as counterfeit; the payload is still decoded into the evidence.
  medtrust::schema::verification_result request_verification(
      const medtrust::schema::bytes_view_t& payload,
      const medtrust::schema::bytes_view_t& signature,
      const medtrust::schema::bytes_view_t& public_key,
      const medtrust::schema::issuer_id_t& issuer_id,
      medtrust::schema::timestamp_milliseconds_t as_of,
      bool ledger_check);

  /// Verify a scanned QR text.
  medtrust::schema::verification_result request_verification(
      std::string_view qr_text,
      medtrust::schema::timestamp_milliseconds_t as_of,
      bool ledger_check);

 private:
  medtrust::schema::verification_result finish_verification(
      medtrust::schema::verification_result result);
  medtrust::schema::verification_result rejected(
      const medtrust::schema::decode_error& error,
      const medtrust::schema::bytes_view_t& raw);
  medtrust::schema::verification_result rejected_parts(
      const medtrust::schema::decode_error& error,
      const medtrust::schema::bytes_view_t& payload,
      const medtrust::schema::issuer_id_t& issuer_id,
      medtrust::schema::timestamp_milliseconds_t as_of);

  std::shared_ptr<medtrust::issuance::signing_service> signer_;
  std::shared_ptr<medtrust::verification::engine> verifier_;
  std::shared_ptr<key_store> keys_;
  std::shared_ptr<medtrust::audit::audit_sink> audit_;
  medtrust::common::clock_fn_t clock_;
};

}  // namespace medtrust::service
