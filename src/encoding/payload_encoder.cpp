#include <medtrust/blake3/hash.hpp>
#include <medtrust/encoding/payload_encoder.hpp>
#include <medtrust/schema/encoding/scale/encoder.hpp>

#include <algorithm>
#include <string>
#include <tuple>

using namespace medtrust::schema;

namespace medtrust::encoding {

namespace {

using payload_wire_v1_t = std::tuple<uint16_t,
                                     std::string,
                                     std::string,
                                     std::string,
                                     std::string,
                                     std::string,
                                     uint64_t>;

decode_error make_error(const decode_error_code code, std::string message) {
  return decode_error{.code = code, .message = std::move(message)};
}

std::optional<decode_error> check_field(const std::string_view name,
                                        const std::string& value) {
  if (value.empty()) {
    return make_error(decode_error_code::empty_field,
                      std::string{name} + " is empty");
  }
  if (value.size() > kMaxFieldLength) {
    return make_error(decode_error_code::field_too_long,
                      std::string{name} + " exceeds maximum length");
  }
  return std::nullopt;
}

}  // namespace

bytes_t encode_payload(const canonical_payload_t& payload) {
  auto encoder = medtrust::schema::encoding::scale_encoder_t{};
  return encoder.encode(
      payload_wire_v1_t{payload.version, payload.medicine_id,
                        payload.batch_number,
                        to_iso_string(payload.manufacture_date),
                        to_iso_string(payload.expiry_date), payload.issuer_id,
                        payload.sequence});
}

std::optional<decode_error> validate_payload(
    const canonical_payload_t& payload) {
  if (payload.version != kCanonicalPayloadVersion) {
    return make_error(decode_error_code::unsupported_version,
                      "unsupported payload version " +
                          std::to_string(payload.version));
  }
  if (auto error = check_field("medicine_id", payload.medicine_id)) {
    return error;
  }
  if (auto error = check_field("batch_number", payload.batch_number)) {
    return error;
  }
  if (auto error = check_field("issuer_id", payload.issuer_id)) {
    return error;
  }
  if (!is_valid(payload.manufacture_date)) {
    return make_error(decode_error_code::invalid_date,
                      "manufacture_date is not a valid calendar date");
  }
  if (!is_valid(payload.expiry_date)) {
    return make_error(decode_error_code::invalid_date,
                      "expiry_date is not a valid calendar date");
  }
  if (payload.expiry_date < payload.manufacture_date) {
    return make_error(decode_error_code::expiry_before_manufacture,
                      "expiry_date precedes manufacture_date");
  }
  return std::nullopt;
}

decode_payload_result_t decode_payload(const bytes_view_t& bytes) {
  if (bytes.empty()) {
    return make_error(decode_error_code::empty_input, "payload is empty");
  }

  auto encoder = medtrust::schema::encoding::scale_encoder_t{};
  auto version = bytes.size() >= sizeof(uint16_t)
                     ? encoder.try_decode<uint16_t>(bytes.first(2))
                     : std::nullopt;
  if (!version.has_value()) {
    return make_error(decode_error_code::malformed_encoding,
                      "payload version tag is truncated");
  }
  if (*version != kCanonicalPayloadVersion) {
    return make_error(decode_error_code::unsupported_version,
                      "unsupported payload version " + std::to_string(*version));
  }

  auto wire = encoder.try_decode<payload_wire_v1_t>(bytes);
  if (!wire.has_value()) {
    return make_error(decode_error_code::malformed_encoding,
                      "payload fields could not be decoded");
  }

  // Only the canonical form is accepted: re-encoding must reproduce the
  // input exactly. This rejects trailing data and non-minimal prefixes.
  auto reencoded = encoder.encode(*wire);
  if (reencoded.size() < bytes.size() &&
      std::equal(std::begin(reencoded), std::end(reencoded),
                 std::begin(bytes))) {
    return make_error(decode_error_code::trailing_bytes,
                      "payload has trailing bytes");
  }
  if (!std::ranges::equal(reencoded, bytes)) {
    return make_error(decode_error_code::malformed_encoding,
                      "payload is not canonically encoded");
  }

  auto manufacture = try_parse_iso_date(std::get<3>(*wire));
  auto expiry = try_parse_iso_date(std::get<4>(*wire));
  if (!manufacture.has_value() || !expiry.has_value()) {
    return make_error(decode_error_code::invalid_date,
                      "payload date is not YYYY-MM-DD");
  }

  auto payload = canonical_payload_t{.version = std::get<0>(*wire),
                                     .medicine_id = std::get<1>(*wire),
                                     .batch_number = std::get<2>(*wire),
                                     .manufacture_date = *manufacture,
                                     .expiry_date = *expiry,
                                     .issuer_id = std::get<5>(*wire),
                                     .sequence = std::get<6>(*wire)};
  if (auto error = validate_payload(payload)) {
    return *error;
  }
  return payload;
}

hash32_t hash_payload(const bytes_view_t& canonical_bytes) {
  return medtrust::blake3::hasher{}
      .update(std::string_view{"medtrust/payload/v1"})
      .update(canonical_bytes)
      .finalize();
}

}  // namespace medtrust::encoding
