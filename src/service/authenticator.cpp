#include <medtrust/common/critical.hpp>
#include <medtrust/encoding/payload_encoder.hpp>
#include <medtrust/encoding/qr_record_codec.hpp>
#include <medtrust/service/authenticator.hpp>

#include <spdlog/spdlog.h>

using namespace medtrust::schema;

namespace medtrust::service {

namespace {

issuance_error make_error(const issuance_error_code code, std::string message) {
  return issuance_error{.code = code, .message = std::move(message)};
}

std::variant<canonical_payload_t, issuance_error> to_payload(
    const payload_fields& fields) {
  auto manufacture = try_parse_iso_date(fields.manufacture_date);
  if (!manufacture.has_value()) {
    return make_error(issuance_error_code::malformed_payload,
                      "manufacture_date '" + fields.manufacture_date +
                          "' is not YYYY-MM-DD");
  }
  auto expiry = try_parse_iso_date(fields.expiry_date);
  if (!expiry.has_value()) {
    return make_error(issuance_error_code::malformed_payload,
                      "expiry_date '" + fields.expiry_date +
                          "' is not YYYY-MM-DD");
  }
  return canonical_payload_t{.version = kCanonicalPayloadVersion,
                             .medicine_id = fields.medicine_id,
                             .batch_number = fields.batch_number,
                             .manufacture_date = *manufacture,
                             .expiry_date = *expiry,
                             .issuer_id = fields.issuer_id,
                             .sequence = fields.sequence};
}

}  // namespace

authenticator::authenticator(
    std::shared_ptr<medtrust::issuance::signing_service> signer,
    std::shared_ptr<medtrust::verification::engine> verifier,
    std::shared_ptr<key_store> keys,
    std::shared_ptr<medtrust::audit::audit_sink> audit,
    medtrust::common::clock_fn_t clock)
    : signer_{std::move(signer)},
      verifier_{std::move(verifier)},
      keys_{std::move(keys)},
      audit_{std::move(audit)},
      clock_{std::move(clock)} {
  medtrust::common::ensure(verifier_ != nullptr,
                           "authenticator requires a verification engine");
  medtrust::common::ensure(audit_ != nullptr,
                           "authenticator requires an audit sink");
}

signing_response_t authenticator::request_signing(
    const payload_fields& fields,
    const std::string_view key_reference) {
  auto event = medtrust::audit::audit_event{
      .timestamp = clock_(),
      .kind = medtrust::audit::audit_event_kind_t::issuance};

  auto response = [&]() -> signing_response_t {
    if (!signer_ || !keys_) {
      return make_error(issuance_error_code::signing_failed,
                        "issuance is not configured");
    }
    auto converted = to_payload(fields);
    if (const auto* error = std::get_if<issuance_error>(&converted)) {
      return *error;
    }
    const auto& payload = std::get<canonical_payload_t>(converted);
    event.record_id = to_hex(medtrust::encoding::hash_payload(
        bytes_view_t{medtrust::encoding::encode_payload(payload)}));

    if (key_reference != payload.issuer_id) {
      return make_error(issuance_error_code::issuer_mismatch,
                        "key reference '" + std::string{key_reference} +
                            "' does not belong to issuer '" +
                            payload.issuer_id + "'");
    }
    auto key = keys_->resolve(key_reference);
    if (!key.has_value()) {
      return make_error(issuance_error_code::unknown_key_reference,
                        "no signing key for '" + std::string{key_reference} +
                            "'");
    }

    auto signed_record = signer_->sign(payload, *key);
    if (const auto* error = std::get_if<issuance_error>(&signed_record)) {
      return *error;
    }
    auto& record = std::get<qr_record_t>(signed_record);
    auto issued = issued_record{
        .record = record,
        .qr_text = medtrust::encoding::to_qr_text(record),
        .payload_hash = medtrust::encoding::hash_payload(
            bytes_view_t{record.payload})};
    return issued;
  }();

  std::visit(overloaded{[&](const issued_record&) { event.outcome = "issued"; },
                        [&](const issuance_error& error) {
                          event.outcome = std::string{to_string(error.code)};
                          event.detail = error.message;
                        }},
             response);
  audit_->emit(event);
  return response;
}

medtrust::schema::verification_result authenticator::finish_verification(
    verification_result result) {
  audit_->emit(medtrust::audit::audit_event{
      .timestamp = clock_(),
      .kind = medtrust::audit::audit_event_kind_t::verification,
      .record_id = to_hex(result.payload_hash),
      .outcome = std::string{to_string(result.outcome)},
      .evidence = result.evidence,
      .detail = std::nullopt});
  return result;
}

medtrust::schema::verification_result authenticator::rejected(
    const decode_error& error,
    const bytes_view_t& raw) {
  auto result = verification_result{};
  result.outcome = verification_outcome_t::counterfeit;
  result.evidence.decode_failure =
      std::string{to_string(error.code)} + ": " + error.message;
  result.payload_hash = medtrust::encoding::hash_payload(raw);
  return finish_verification(std::move(result));
}

medtrust::schema::verification_result authenticator::rejected_parts(
    const decode_error& error,
    const bytes_view_t& payload,
    const issuer_id_t& issuer_id,
    const timestamp_milliseconds_t as_of) {
  auto result = verification_result{};
  result.outcome = verification_outcome_t::counterfeit;
  auto& evidence = result.evidence;
  evidence.decode_failure =
      std::string{to_string(error.code)} + ": " + error.message;
  // The signature cannot be checked, but the payload can still be read.
  auto decoded_payload = medtrust::encoding::decode_payload(payload);
  if (const auto* decoded =
          std::get_if<canonical_payload_t>(&decoded_payload)) {
    evidence.payload_decoded = true;
    evidence.issuer_consistent = decoded->issuer_id == issuer_id;
    evidence.expiry_check = is_after_day(as_of, decoded->expiry_date)
                                ? expiry_check_t::expired
                                : expiry_check_t::within_expiry;
    result.payload = *decoded;
  }
  result.payload_hash = medtrust::encoding::hash_payload(payload);
  return finish_verification(std::move(result));
}

medtrust::schema::verification_result authenticator::request_verification(
    const bytes_view_t& payload,
    const bytes_view_t& signature,
    const bytes_view_t& public_key,
    const issuer_id_t& issuer_id,
    const timestamp_milliseconds_t as_of,
    const bool ledger_check) {
  auto assembled =
      medtrust::encoding::make_qr_record(payload, signature, public_key,
                                         issuer_id);
  if (const auto* error = std::get_if<decode_error>(&assembled)) {
    return rejected_parts(*error, payload, issuer_id, as_of);
  }
  return finish_verification(verifier_->verify(
      std::get<qr_record_t>(assembled), as_of, ledger_check));
}

medtrust::schema::verification_result authenticator::request_verification(
    const std::string_view qr_text,
    const timestamp_milliseconds_t as_of,
    const bool ledger_check) {
  auto parsed = medtrust::encoding::parse_qr_text(qr_text);
  if (const auto* error = std::get_if<decode_error>(&parsed)) {
    return rejected(*error, make_bytes_view(qr_text));
  }
  return finish_verification(
      verifier_->verify(std::get<qr_record_t>(parsed), as_of, ledger_check));
}

}  // namespace medtrust::service
