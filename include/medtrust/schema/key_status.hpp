#pragma once

#include <medtrust/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: key status.
// Point-in-time answer of the key registry. `unknown` (never registered) is
// deliberately distinct from `revoked` (trust withdrawn).
namespace medtrust::schema {

enum class key_status_t : uint8_t { active = 0, revoked = 1, unknown = 2 };

inline constexpr auto kKeyStatusMappings = std::array{
    enum_mapping_t<key_status_t>{"active", key_status_t::active},
    enum_mapping_t<key_status_t>{"revoked", key_status_t::revoked},
    enum_mapping_t<key_status_t>{"unknown", key_status_t::unknown}};

inline constexpr std::string_view to_string(const key_status_t value) {
  return to_string(value, kKeyStatusMappings).value_or("unknown");
}

}  // namespace medtrust::schema
