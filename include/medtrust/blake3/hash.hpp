#pragma once
#include <medtrust/schema/primitives.hpp>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

namespace medtrust::blake3 {

/// Incremental BLAKE3 hasher. Feed any number of segments, then finalize.
class hasher final {
 public:
  hasher();
  ~hasher();

  hasher(const hasher&) = delete;
  hasher& operator=(const hasher&) = delete;

  hasher& update(const std::string_view& str);
  hasher& update(const medtrust::schema::bytes_view_t& bytes);

  medtrust::schema::hash32_t finalize() const;

 private:
  struct state;
  std::unique_ptr<state> state_;
};

medtrust::schema::hash32_t hash(const std::string_view& str);
medtrust::schema::hash32_t hash(const medtrust::schema::bytes_view_t& bytes);

}  // namespace medtrust::blake3
