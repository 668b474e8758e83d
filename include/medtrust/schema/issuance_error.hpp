#pragma once

#include <medtrust/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace medtrust::schema {

enum class issuance_error_code : uint32_t {
  malformed_payload = 1,
  issuer_mismatch = 2,
  key_not_registered = 3,
  key_revoked = 4,
  registry_unavailable = 5,
  signing_failed = 6,
  unknown_key_reference = 7,
};

inline constexpr auto kIssuanceErrorCodeMappings = std::array{
    enum_mapping_t<issuance_error_code>{
        "malformed_payload", issuance_error_code::malformed_payload},
    enum_mapping_t<issuance_error_code>{"issuer_mismatch",
                                        issuance_error_code::issuer_mismatch},
    enum_mapping_t<issuance_error_code>{
        "key_not_registered", issuance_error_code::key_not_registered},
    enum_mapping_t<issuance_error_code>{"key_revoked",
                                        issuance_error_code::key_revoked},
    enum_mapping_t<issuance_error_code>{
        "registry_unavailable", issuance_error_code::registry_unavailable},
    enum_mapping_t<issuance_error_code>{"signing_failed",
                                        issuance_error_code::signing_failed},
    enum_mapping_t<issuance_error_code>{
        "unknown_key_reference", issuance_error_code::unknown_key_reference}};

inline constexpr std::string_view to_string(const issuance_error_code value) {
  return to_string(value, kIssuanceErrorCodeMappings).value_or("unknown");
}

struct issuance_error final {
  issuance_error_code code{issuance_error_code::malformed_payload};
  std::string message;
};

}  // namespace medtrust::schema
