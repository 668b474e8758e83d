#include <medtrust/common/critical.hpp>
#include <medtrust/encoding/payload_encoder.hpp>
#include <medtrust/issuance/signing_service.hpp>

#include <spdlog/spdlog.h>

namespace medtrust::issuance {

namespace {

medtrust::schema::issuance_error make_error(
    const medtrust::schema::issuance_error_code code,
    std::string message) {
  return medtrust::schema::issuance_error{.code = code,
                                          .message = std::move(message)};
}

}  // namespace

signing_service::signing_service(
    std::shared_ptr<medtrust::registry::key_registry> registry,
    std::shared_ptr<medtrust::ledger::anchor_client> ledger,
    const medtrust::schema::anchor_mode_t mode,
    medtrust::common::clock_fn_t clock)
    : registry_{std::move(registry)},
      ledger_{std::move(ledger)},
      mode_{mode},
      clock_{std::move(clock)} {
  medtrust::common::ensure(registry_ != nullptr,
                           "signing service requires a key registry");
  if (mode_ != medtrust::schema::anchor_mode_t::disabled) {
    medtrust::common::ensure(ledger_ != nullptr,
                             "anchoring enabled without a ledger client");
    coordinator_ = std::make_shared<medtrust::ledger::batch_coordinator>(ledger_);
  }
  if (mode_ == medtrust::schema::anchor_mode_t::asynchronous) {
    dispatcher_ = std::make_unique<anchor_dispatcher>(ledger_, coordinator_);
  }
}

sign_result_t signing_service::sign(
    const medtrust::schema::canonical_payload_t& payload,
    const medtrust::crypto::private_key& key) {
  if (auto invalid = medtrust::encoding::validate_payload(payload)) {
    return make_error(medtrust::schema::issuance_error_code::malformed_payload,
                      invalid->message);
  }

  auto status = medtrust::schema::key_status_t::unknown;
  try {
    status = registry_->status_of(payload.issuer_id, key.public_key(), clock_());
  } catch (const medtrust::registry::registry_unavailable& e) {
    spdlog::error("Refusing to sign for '{}': {}", payload.issuer_id, e.what());
    return make_error(
        medtrust::schema::issuance_error_code::registry_unavailable, e.what());
  }
  switch (status) {
    case medtrust::schema::key_status_t::active:
      break;
    case medtrust::schema::key_status_t::revoked:
      return make_error(medtrust::schema::issuance_error_code::key_revoked,
                        "issuer key is revoked");
    case medtrust::schema::key_status_t::unknown:
      return make_error(
          medtrust::schema::issuance_error_code::key_not_registered,
          "key is not registered for issuer " + payload.issuer_id);
  }

  auto canonical = medtrust::encoding::encode_payload(payload);
  auto signature =
      key.sign(medtrust::schema::bytes_view_t{canonical});
  if (!signature.has_value()) {
    return make_error(medtrust::schema::issuance_error_code::signing_failed,
                      "ECDSA signing failed");
  }

  auto hash = medtrust::encoding::hash_payload(
      medtrust::schema::bytes_view_t{canonical});
  auto record = medtrust::schema::qr_record_t{
      .format_version = medtrust::schema::kQrRecordFormatVersion,
      .payload = std::move(canonical),
      .signature = *signature,
      .issuer_public_key = key.public_key(),
      .issuer_id = payload.issuer_id,
      .anchor = std::nullopt};

  switch (mode_) {
    case medtrust::schema::anchor_mode_t::disabled:
      break;
    case medtrust::schema::anchor_mode_t::synchronous: {
      auto anchored = ledger_->anchor(hash);
      std::visit(
          overloaded{
              [&](const medtrust::schema::anchor_receipt& receipt) {
                coordinator_->remember(receipt);
                record.anchor = receipt;
              },
              [&](const medtrust::schema::anchor_error& error) {
                spdlog::warn("Anchoring {} failed ({}), queued for retry: {}",
                             medtrust::schema::to_hex(hash),
                             medtrust::schema::to_string(error.code),
                             error.message);
                coordinator_->enqueue(hash);
              }},
          anchored);
      break;
    }
    case medtrust::schema::anchor_mode_t::asynchronous:
      dispatcher_->submit(hash);
      break;
  }

  spdlog::info("Issued record for medicine '{}' batch '{}' sequence {}",
               payload.medicine_id, payload.batch_number, payload.sequence);
  return record;
}

std::optional<medtrust::schema::anchor_result_t> signing_service::anchor_status(
    const medtrust::schema::hash32_t& hash) const {
  if (!coordinator_) {
    return std::nullopt;
  }
  if (auto receipt = coordinator_->known_receipt(hash)) {
    return *receipt;
  }
  if (dispatcher_) {
    return dispatcher_->status(hash);
  }
  return std::nullopt;
}

medtrust::schema::qr_record_t signing_service::attach_anchor(
    const medtrust::schema::qr_record_t& record) const {
  auto attached = record;
  if (attached.anchor.has_value()) {
    return attached;
  }
  auto status = anchor_status(medtrust::encoding::hash_payload(
      medtrust::schema::bytes_view_t{record.payload}));
  if (status.has_value()) {
    if (const auto* receipt =
            std::get_if<medtrust::schema::anchor_receipt>(&*status)) {
      attached.anchor = *receipt;
    }
  }
  return attached;
}

void signing_service::drain() {
  if (dispatcher_) {
    dispatcher_->drain();
  }
}

medtrust::ledger::anchor_batch_result_t signing_service::retry_pending() {
  if (!coordinator_) {
    return {};
  }
  return coordinator_->retry_pending();
}

}  // namespace medtrust::issuance
