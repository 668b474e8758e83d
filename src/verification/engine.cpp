#include <medtrust/common/critical.hpp>
#include <medtrust/crypto/verify.hpp>
#include <medtrust/encoding/payload_encoder.hpp>
#include <medtrust/verification/engine.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <exception>

using namespace medtrust::schema;

namespace medtrust::verification {

verification_outcome_t classify(const verification_evidence& evidence) {
  if (!evidence.payload_decoded || !evidence.issuer_consistent ||
      !evidence.signature_valid) {
    return verification_outcome_t::counterfeit;
  }
  if (!evidence.registry_reachable) {
    return verification_outcome_t::unverified;
  }
  switch (evidence.key_status) {
    case key_status_t::revoked:
      return verification_outcome_t::counterfeit;
    case key_status_t::unknown:
      return verification_outcome_t::unverified;
    case key_status_t::active:
      break;
  }
  if (evidence.expiry_check == expiry_check_t::expired) {
    return verification_outcome_t::expired;
  }
  return verification_outcome_t::verified;
}

verification_outcome_t classify_interrupted(const verification_evidence& evidence,
                                            const engine::stage_t reached) {
  if (reached >= engine::stage_t::decoded &&
      (!evidence.payload_decoded || !evidence.issuer_consistent)) {
    return verification_outcome_t::counterfeit;
  }
  if (reached >= engine::stage_t::signature_checked &&
      !evidence.signature_valid) {
    return verification_outcome_t::counterfeit;
  }
  if (reached >= engine::stage_t::key_checked &&
      evidence.registry_reachable &&
      evidence.key_status == key_status_t::revoked) {
    return verification_outcome_t::counterfeit;
  }
  return verification_outcome_t::unverified;
}

engine::engine(std::shared_ptr<medtrust::registry::key_registry> registry,
               std::shared_ptr<medtrust::ledger::anchor_client> ledger,
               medtrust::common::clock_fn_t clock)
    : registry_{std::move(registry)},
      ledger_{std::move(ledger)},
      clock_{std::move(clock)} {
  medtrust::common::ensure(registry_ != nullptr,
                           "verification engine requires a key registry");
}

verification_result engine::verify(const qr_record_t& record,
                                   const bool ledger_check) const {
  return verify(record, clock_(), ledger_check);
}

verification_result engine::verify(const qr_record_t& record,
                                   const timestamp_milliseconds_t as_of,
                                   const bool ledger_check) const {
  auto result = verification_result{};
  auto reached = stage_t::started;
  try {
    evaluate(record, as_of, ledger_check, result, reached);
  } catch (const std::exception& e) {
    spdlog::error("Verification of issuer '{}' aborted after stage {}: {}",
                  record.issuer_id, static_cast<int>(reached), e.what());
    result.evidence.internal_error = true;
    result.outcome = classify_interrupted(result.evidence, reached);
  }
  return result;
}

void engine::evaluate(const qr_record_t& record,
                      const timestamp_milliseconds_t as_of,
                      const bool ledger_check,
                      verification_result& result,
                      stage_t& reached) const {
  auto& evidence = result.evidence;
  auto payload_bytes = bytes_view_t{record.payload};

  // 1. Decode. Strict decoding only accepts canonical bytes, so the decoded
  // payload re-encodes to exactly `record.payload`. Payloads under an unknown
  // envelope version are never decoded.
  auto issuer_id = record.issuer_id;
  auto expiry = std::optional<calendar_date>{};
  if (record.format_version != kQrRecordFormatVersion) {
    evidence.decode_failure =
        fmt::format("{}: format version {} is not {}",
                    to_string(decode_error_code::unsupported_version),
                    record.format_version, kQrRecordFormatVersion);
  } else {
    std::visit(overloaded{[&](const canonical_payload_t& payload) {
                            evidence.payload_decoded = true;
                            evidence.issuer_consistent =
                                payload.issuer_id == record.issuer_id;
                            issuer_id = payload.issuer_id;
                            expiry = payload.expiry_date;
                            result.payload = payload;
                          },
                          [&](const decode_error& error) {
                            evidence.decode_failure =
                                std::string{to_string(error.code)} + ": " +
                                error.message;
                          }},
               medtrust::encoding::decode_payload(payload_bytes));
  }
  reached = stage_t::decoded;

  // 2. Signature over the exact bytes carried.
  evidence.signature_valid = medtrust::crypto::verify_signature(
      payload_bytes, record.issuer_public_key, record.signature);
  reached = stage_t::signature_checked;

  // 3. Key status at the as-of instant.
  try {
    evidence.key_status =
        registry_->status_of(issuer_id, record.issuer_public_key, as_of);
  } catch (const medtrust::registry::registry_unavailable& e) {
    spdlog::warn("Key registry unreachable during verification: {}", e.what());
    evidence.registry_reachable = false;
    evidence.key_status = key_status_t::unknown;
  }
  reached = stage_t::key_checked;

  // 4. Expiry, by calendar date. The expiry date itself is still in date.
  if (expiry.has_value()) {
    evidence.expiry_check = is_after_day(as_of, *expiry)
                                ? expiry_check_t::expired
                                : expiry_check_t::within_expiry;
  }
  reached = stage_t::expiry_checked;

  // 5. Ledger.
  result.payload_hash = medtrust::encoding::hash_payload(payload_bytes);
  if (ledger_check) {
    if (!ledger_) {
      evidence.anchor_status = anchor_status_t::ledger_unavailable;
    } else {
      std::visit(overloaded{[&](const anchor_record& anchored) {
                              if (anchored.anchored) {
                                evidence.anchor_status =
                                    anchor_status_t::anchored;
                                evidence.ledger_reference =
                                    anchored.ledger_reference;
                              } else {
                                evidence.anchor_status =
                                    anchor_status_t::not_anchored;
                              }
                            },
                            [&](const anchor_error& error) {
                              spdlog::warn("Ledger check skipped ({}): {}",
                                           to_string(error.code),
                                           error.message);
                              evidence.anchor_status =
                                  anchor_status_t::ledger_unavailable;
                            }},
                 ledger_->is_anchored(result.payload_hash));
    }
  }

  reached = stage_t::ledger_checked;

  result.outcome = classify(evidence);
  spdlog::debug("Verified record of issuer '{}': {}", record.issuer_id,
                to_string(result.outcome));
}

}  // namespace medtrust::verification
