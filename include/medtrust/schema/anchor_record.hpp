#pragma once
#include <medtrust/schema/enum_string.hpp>
#include <medtrust/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

// Schema types: ledger anchoring.
// Read-through view of what the ledger says about one payload hash. The
// engine never owns ledger storage.
namespace medtrust::schema {

struct anchor_receipt final {
  hash32_t hash{};
  timestamp_milliseconds_t anchored_at{};
  std::string ledger_reference;
  // True when the ledger already held this hash; the receipt then refers to
  // the original anchoring.
  bool previously_anchored{false};

  bool operator==(const anchor_receipt&) const = default;
};

struct anchor_record final {
  hash32_t hash{};
  bool anchored{false};
  std::optional<timestamp_milliseconds_t> anchored_at;
  std::optional<std::string> ledger_reference;
};

enum class anchor_error_code : uint32_t {
  ledger_unavailable = 1,
  ledger_timeout = 2,
  submission_rejected = 3,
};

inline constexpr auto kAnchorErrorCodeMappings = std::array{
    enum_mapping_t<anchor_error_code>{
        "ledger_unavailable", anchor_error_code::ledger_unavailable},
    enum_mapping_t<anchor_error_code>{
        "ledger_timeout", anchor_error_code::ledger_timeout},
    enum_mapping_t<anchor_error_code>{
        "submission_rejected", anchor_error_code::submission_rejected}};

inline constexpr std::string_view to_string(const anchor_error_code value) {
  return to_string(value, kAnchorErrorCodeMappings).value_or("unknown");
}

struct anchor_error final {
  anchor_error_code code{anchor_error_code::ledger_unavailable};
  std::string message;

  /// Timeouts and outages are both "unreachable" from a verifier's view.
  bool unreachable() const {
    return code == anchor_error_code::ledger_unavailable ||
           code == anchor_error_code::ledger_timeout;
  }
};

using anchor_result_t = std::variant<anchor_receipt, anchor_error>;
using anchor_query_result_t = std::variant<anchor_record, anchor_error>;

}  // namespace medtrust::schema
