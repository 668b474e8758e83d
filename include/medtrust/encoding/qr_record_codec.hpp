#pragma once

#include <medtrust/schema/decode_error.hpp>
#include <medtrust/schema/primitives.hpp>
#include <medtrust/schema/qr_record.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace medtrust::encoding {

using decode_qr_result_t =
    std::variant<medtrust::schema::qr_record_t, medtrust::schema::decode_error>;

/// Binary form printed into QR symbols: SCALE encoding of
/// `(format_version, payload, signature, issuer_public_key, issuer_id)`.
/// Issuer-side anchor metadata is not included.
medtrust::schema::bytes_t encode_qr_record(
    const medtrust::schema::qr_record_t& record);

/// Strict inverse of `encode_qr_record`. The embedded payload is carried as
/// opaque bytes; judging it is the verifier's job.
decode_qr_result_t decode_qr_record(const medtrust::schema::bytes_view_t& bytes);

/// Text form handed to the QR image renderer (base64 of the binary form).
std::string to_qr_text(const medtrust::schema::qr_record_t& record);

/// Parse scanned QR text. Whitespace inside the text is ignored.
decode_qr_result_t parse_qr_text(const std::string_view text);

/// Assemble a record from separately transported parts, checking only the
/// fixed key and signature widths.
decode_qr_result_t make_qr_record(
    const medtrust::schema::bytes_view_t& payload,
    const medtrust::schema::bytes_view_t& signature,
    const medtrust::schema::bytes_view_t& public_key,
    const medtrust::schema::issuer_id_t& issuer_id);

}  // namespace medtrust::encoding
