#pragma once
#include <medtrust/common/critical.hpp>
#include <medtrust/schema/encoding/encoder.hpp>
#include <exception>
#include <iterator>
#include <scale/scale.hpp>

namespace medtrust::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  medtrust::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, medtrust::schema::bytes_t& out);

  template <typename T>
  std::optional<T> try_decode(const medtrust::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
medtrust::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  // Only in-memory schema values are encoded here; a failure means the
  // codec itself is broken.
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    medtrust::common::critical("SCALE encoding of a schema value failed");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        medtrust::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const medtrust::schema::bytes_view_t& bytes) {
  // Input here is attacker controlled (scanned QR text); the codec reports
  // short reads either as an error result or by throwing.
  try {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded).value();
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

}  // namespace medtrust::schema::encoding
