#pragma once
#include <medtrust/schema/calendar_date.hpp>
#include <medtrust/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema type: canonical payload.
// Medicine-unit metadata that an issuer signs. Field order is the wire order
// and is part of the format; new fields require a new version.
namespace medtrust::schema {

template <uint16_t Version>
struct canonical_payload;

template <>
struct canonical_payload<1> final {
  uint16_t version{1};
  std::string medicine_id;
  std::string batch_number;
  calendar_date manufacture_date;
  calendar_date expiry_date;
  issuer_id_t issuer_id;
  // Issuer-chosen sequence; distinguishes units of the same batch.
  uint64_t sequence{};

  bool operator==(const canonical_payload&) const = default;
};

using canonical_payload_t = canonical_payload<1>;

inline constexpr auto kCanonicalPayloadVersion = uint16_t{1};

}  // namespace medtrust::schema
