#pragma once
#include <medtrust/schema/primitives.hpp>
#include <optional>
#include <span>

namespace medtrust::schema::encoding {

/// Build-time selected binary codec. Callers name the library through a tag
/// (`encoder<scale_encoder_tag>`); swapping codecs is a rebuild, never a
/// runtime switch, because signatures are computed over its output.
template <typename Library>
struct encoder {
  template <typename T>
  medtrust::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, medtrust::schema::bytes_t& out);

  /// std::nullopt on short, malformed or over-long input. There is no
  /// throwing variant: every decoded byte string may come from a scan.
  template <typename T>
  std::optional<T> try_decode(const medtrust::schema::bytes_view_t& bytes);
};

}  // namespace medtrust::schema::encoding
