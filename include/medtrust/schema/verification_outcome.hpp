#pragma once
#include <medtrust/schema/canonical_payload.hpp>
#include <medtrust/schema/enum_string.hpp>
#include <medtrust/schema/key_status.hpp>
#include <medtrust/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema types: verification outcome and evidence bundle.
// The outcome is recomputed on every scan; the evidence records every check
// that could be evaluated, including ones that did not decide the outcome.
namespace medtrust::schema {

enum class verification_outcome_t : uint8_t {
  verified = 0,
  expired = 1,
  unverified = 2,
  counterfeit = 3
};

inline constexpr auto kVerificationOutcomeMappings = std::array{
    enum_mapping_t<verification_outcome_t>{"verified",
                                           verification_outcome_t::verified},
    enum_mapping_t<verification_outcome_t>{"expired",
                                           verification_outcome_t::expired},
    enum_mapping_t<verification_outcome_t>{"unverified",
                                           verification_outcome_t::unverified},
    enum_mapping_t<verification_outcome_t>{
        "counterfeit", verification_outcome_t::counterfeit}};

inline constexpr std::string_view to_string(
    const verification_outcome_t value) {
  return to_string(value, kVerificationOutcomeMappings).value_or("unknown");
}

enum class anchor_status_t : uint8_t {
  anchored = 0,
  not_anchored = 1,
  ledger_unavailable = 2
};

inline constexpr auto kAnchorStatusMappings = std::array{
    enum_mapping_t<anchor_status_t>{"anchored", anchor_status_t::anchored},
    enum_mapping_t<anchor_status_t>{"not_anchored",
                                    anchor_status_t::not_anchored},
    enum_mapping_t<anchor_status_t>{"ledger_unavailable",
                                    anchor_status_t::ledger_unavailable}};

inline constexpr std::string_view to_string(const anchor_status_t value) {
  return to_string(value, kAnchorStatusMappings).value_or("unknown");
}

enum class expiry_check_t : uint8_t {
  not_evaluated = 0,
  within_expiry = 1,
  expired = 2
};

inline constexpr auto kExpiryCheckMappings = std::array{
    enum_mapping_t<expiry_check_t>{"not_evaluated",
                                   expiry_check_t::not_evaluated},
    enum_mapping_t<expiry_check_t>{"within_expiry",
                                   expiry_check_t::within_expiry},
    enum_mapping_t<expiry_check_t>{"expired", expiry_check_t::expired}};

inline constexpr std::string_view to_string(const expiry_check_t value) {
  return to_string(value, kExpiryCheckMappings).value_or("unknown");
}

struct verification_evidence final {
  bool payload_decoded{false};
  // Envelope issuer id equals the signed payload's issuer id.
  bool issuer_consistent{false};
  bool signature_valid{false};
  key_status_t key_status{key_status_t::unknown};
  bool registry_reachable{true};
  expiry_check_t expiry_check{expiry_check_t::not_evaluated};
  // Set only when a ledger check was requested.
  std::optional<anchor_status_t> anchor_status;
  std::optional<std::string> ledger_reference;
  std::optional<std::string> decode_failure;
  // An internal failure cut the run short; later checks kept their defaults.
  bool internal_error{false};
};

struct verification_result final {
  verification_outcome_t outcome{verification_outcome_t::counterfeit};
  verification_evidence evidence;
  std::optional<canonical_payload_t> payload;
  hash32_t payload_hash{};

  /// Verified, but the auxiliary anchoring signal was missing or could not
  /// be obtained.
  bool reduced_confidence() const {
    return outcome == verification_outcome_t::verified &&
           evidence.anchor_status.has_value() &&
           *evidence.anchor_status != anchor_status_t::anchored;
  }
};

}  // namespace medtrust::schema
