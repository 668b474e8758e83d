#pragma once

#include <medtrust/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: anchor mode.
// How issuance submits payload hashes to the ledger.
namespace medtrust::schema {

enum class anchor_mode_t : uint8_t {
  disabled = 0,
  synchronous = 1,
  // Submission runs on a background worker; the record is returned first.
  asynchronous = 2
};

inline constexpr auto kAnchorModeMappings = std::array{
    enum_mapping_t<anchor_mode_t>{"disabled", anchor_mode_t::disabled},
    enum_mapping_t<anchor_mode_t>{"sync", anchor_mode_t::synchronous},
    enum_mapping_t<anchor_mode_t>{"async", anchor_mode_t::asynchronous}};

inline constexpr std::string_view to_string(const anchor_mode_t value) {
  return to_string(value, kAnchorModeMappings).value_or("unknown");
}

}  // namespace medtrust::schema
