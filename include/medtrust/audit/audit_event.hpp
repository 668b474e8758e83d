#pragma once
#include <medtrust/schema/enum_string.hpp>
#include <medtrust/schema/primitives.hpp>
#include <medtrust/schema/verification_outcome.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace medtrust::audit {

enum class audit_event_kind_t : uint8_t { issuance = 0, verification = 1 };

inline constexpr auto kAuditEventKindMappings = std::array{
    medtrust::schema::enum_mapping_t<audit_event_kind_t>{
        "issuance", audit_event_kind_t::issuance},
    medtrust::schema::enum_mapping_t<audit_event_kind_t>{
        "verification", audit_event_kind_t::verification}};

inline constexpr std::string_view to_string(const audit_event_kind_t value) {
  return medtrust::schema::to_string(value, kAuditEventKindMappings)
      .value_or("unknown");
}

/// One issuance or verification call. Immutable once emitted.
struct audit_event final {
  medtrust::schema::timestamp_milliseconds_t timestamp{};
  audit_event_kind_t kind{audit_event_kind_t::verification};
  // Hex payload hash of the record concerned.
  std::string record_id;
  // Verification outcome name, "issued", or the issuance error code name.
  std::string outcome;
  std::optional<medtrust::schema::verification_evidence> evidence;
  std::optional<std::string> detail;
};

}  // namespace medtrust::audit
