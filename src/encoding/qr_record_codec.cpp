#include <medtrust/encoding/qr_record_codec.hpp>
#include <medtrust/schema/encoding/scale/encoder.hpp>

#include <algorithm>
#include <string>
#include <tuple>

using namespace medtrust::schema;

namespace medtrust::encoding {

namespace {

using qr_wire_v1_t =
    std::tuple<uint16_t, bytes_t, signature_t, public_key_t, std::string>;

decode_error make_error(const decode_error_code code, std::string message) {
  return decode_error{.code = code, .message = std::move(message)};
}

}  // namespace

bytes_t encode_qr_record(const qr_record_t& record) {
  auto encoder = medtrust::schema::encoding::scale_encoder_t{};
  return encoder.encode(qr_wire_v1_t{record.format_version, record.payload,
                                     record.signature,
                                     record.issuer_public_key,
                                     record.issuer_id});
}

decode_qr_result_t decode_qr_record(const bytes_view_t& bytes) {
  if (bytes.empty()) {
    return make_error(decode_error_code::empty_input, "QR record is empty");
  }
  auto encoder = medtrust::schema::encoding::scale_encoder_t{};
  auto version = bytes.size() >= sizeof(uint16_t)
                     ? encoder.try_decode<uint16_t>(bytes.first(2))
                     : std::nullopt;
  if (!version.has_value()) {
    return make_error(decode_error_code::malformed_encoding,
                      "QR record format tag is truncated");
  }
  if (*version != kQrRecordFormatVersion) {
    return make_error(decode_error_code::unsupported_version,
                      "unsupported QR record format " +
                          std::to_string(*version));
  }

  auto wire = encoder.try_decode<qr_wire_v1_t>(bytes);
  if (!wire.has_value()) {
    return make_error(decode_error_code::malformed_encoding,
                      "QR record fields could not be decoded");
  }
  if (!std::ranges::equal(encoder.encode(*wire), bytes)) {
    return make_error(decode_error_code::trailing_bytes,
                      "QR record is not canonically encoded");
  }

  auto record = qr_record_t{};
  record.format_version = std::get<0>(*wire);
  record.payload = std::move(std::get<1>(*wire));
  record.signature = std::get<2>(*wire);
  record.issuer_public_key = std::get<3>(*wire);
  record.issuer_id = std::move(std::get<4>(*wire));
  if (!try_make_public_key(record.issuer_public_key).has_value()) {
    return make_error(decode_error_code::invalid_public_key,
                      "issuer public key is not a compressed point");
  }
  return record;
}

std::string to_qr_text(const qr_record_t& record) {
  auto encoded = encode_qr_record(record);
  return to_base64(bytes_view_t{encoded.data(), encoded.size()});
}

decode_qr_result_t parse_qr_text(const std::string_view text) {
  auto bytes = try_from_base64(text);
  if (!bytes.has_value()) {
    return make_error(decode_error_code::invalid_text,
                      "QR text is not valid base64");
  }
  return decode_qr_record(bytes_view_t{bytes->data(), bytes->size()});
}

decode_qr_result_t make_qr_record(const bytes_view_t& payload,
                                  const bytes_view_t& signature,
                                  const bytes_view_t& public_key,
                                  const issuer_id_t& issuer_id) {
  auto parsed_signature = try_make_signature(signature);
  if (!parsed_signature.has_value()) {
    return make_error(decode_error_code::invalid_signature_length,
                      "signature must be 64 bytes");
  }
  auto parsed_key = try_make_public_key(public_key);
  if (!parsed_key.has_value()) {
    return make_error(decode_error_code::invalid_public_key,
                      "public key must be a 33 byte compressed point");
  }
  auto record = qr_record_t{};
  record.format_version = kQrRecordFormatVersion;
  record.payload = make_bytes(payload);
  record.signature = *parsed_signature;
  record.issuer_public_key = *parsed_key;
  record.issuer_id = issuer_id;
  return record;
}

}  // namespace medtrust::encoding
