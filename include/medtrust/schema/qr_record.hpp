#pragma once
#include <medtrust/schema/anchor_record.hpp>
#include <medtrust/schema/primitives.hpp>

#include <cstdint>
#include <optional>

// Schema type: QR record.
// What a physical unit carries. `payload` holds the canonical payload bytes
// exactly as signed; verifiers re-derive the payload from them and never
// trust a separately supplied structure.
namespace medtrust::schema {

template <uint16_t Version>
struct qr_record;

template <>
struct qr_record<1> final {
  uint16_t format_version{1};
  bytes_t payload;
  signature_t signature{};
  public_key_t issuer_public_key{};
  issuer_id_t issuer_id;
  // Issuer-side metadata. Not covered by the signature and not part of the
  // QR text form.
  std::optional<anchor_receipt> anchor;
};

using qr_record_t = qr_record<1>;

inline constexpr auto kQrRecordFormatVersion = uint16_t{1};

}  // namespace medtrust::schema
