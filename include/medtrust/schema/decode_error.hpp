#pragma once

#include <medtrust/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace medtrust::schema {

enum class decode_error_code : uint32_t {
  empty_input = 1,
  unsupported_version = 2,
  malformed_encoding = 3,
  trailing_bytes = 4,
  invalid_date = 5,
  empty_field = 6,
  expiry_before_manufacture = 7,
  invalid_public_key = 8,
  invalid_signature_length = 9,
  invalid_text = 10,
  field_too_long = 11,
};

inline constexpr auto kDecodeErrorCodeMappings = std::array{
    enum_mapping_t<decode_error_code>{"empty_input",
                                      decode_error_code::empty_input},
    enum_mapping_t<decode_error_code>{"unsupported_version",
                                      decode_error_code::unsupported_version},
    enum_mapping_t<decode_error_code>{"malformed_encoding",
                                      decode_error_code::malformed_encoding},
    enum_mapping_t<decode_error_code>{"trailing_bytes",
                                      decode_error_code::trailing_bytes},
    enum_mapping_t<decode_error_code>{"invalid_date",
                                      decode_error_code::invalid_date},
    enum_mapping_t<decode_error_code>{"empty_field",
                                      decode_error_code::empty_field},
    enum_mapping_t<decode_error_code>{
        "expiry_before_manufacture",
        decode_error_code::expiry_before_manufacture},
    enum_mapping_t<decode_error_code>{"invalid_public_key",
                                      decode_error_code::invalid_public_key},
    enum_mapping_t<decode_error_code>{
        "invalid_signature_length",
        decode_error_code::invalid_signature_length},
    enum_mapping_t<decode_error_code>{"invalid_text",
                                      decode_error_code::invalid_text},
    enum_mapping_t<decode_error_code>{"field_too_long",
                                      decode_error_code::field_too_long}};

inline constexpr std::string_view to_string(const decode_error_code value) {
  return to_string(value, kDecodeErrorCodeMappings).value_or("unknown");
}

struct decode_error final {
  decode_error_code code{decode_error_code::malformed_encoding};
  std::string message;
};

}  // namespace medtrust::schema
