#pragma once

#include <medtrust/schema/canonical_payload.hpp>
#include <medtrust/schema/decode_error.hpp>
#include <medtrust/schema/primitives.hpp>

#include <cstddef>
#include <optional>
#include <variant>

namespace medtrust::encoding {

/// Upper bound on every string field, in bytes. Keeps a record within what a
/// printed QR symbol holds comfortably.
inline constexpr auto kMaxFieldLength = std::size_t{128};

using decode_payload_result_t =
    std::variant<medtrust::schema::canonical_payload_t,
                 medtrust::schema::decode_error>;

/// Canonical byte form of a payload.
///
/// Layout is the SCALE encoding of
/// `(version, medicine_id, batch_number, manufacture_date, expiry_date,
///   issuer_id, sequence)` with dates as `YYYY-MM-DD` text. The version is
/// the first two bytes (little endian) so decoders can dispatch before
/// reading anything else. Strings are length prefixed, which makes the
/// encoding injective.
medtrust::schema::bytes_t encode_payload(
    const medtrust::schema::canonical_payload_t& payload);

/// Strict inverse of `encode_payload`.
///
/// Only byte sequences that `encode_payload` itself would produce are
/// accepted: unknown versions, truncated or trailing data, non-minimal
/// length prefixes, invalid dates and empty required fields are all
/// rejected. A partially decoded payload is never returned.
decode_payload_result_t decode_payload(
    const medtrust::schema::bytes_view_t& bytes);

/// Field-level well-formedness shared by issuance and decoding.
std::optional<medtrust::schema::decode_error> validate_payload(
    const medtrust::schema::canonical_payload_t& payload);

/// Hash anchored on the ledger for a payload: BLAKE3 over a fixed domain
/// tag followed by the canonical bytes.
medtrust::schema::hash32_t hash_payload(
    const medtrust::schema::bytes_view_t& canonical_bytes);

}  // namespace medtrust::encoding
