#include <blake3.h>
#include <medtrust/blake3/hash.hpp>

namespace medtrust::blake3 {

struct hasher::state {
  blake3_hasher native{};
};

hasher::hasher() : state_{std::make_unique<state>()} {
  blake3_hasher_init(&state_->native);
}

hasher::~hasher() = default;

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_->native, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const medtrust::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_->native, bytes.data(), bytes.size());
  return *this;
}

medtrust::schema::hash32_t hasher::finalize() const {
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<medtrust::schema::hash32_t>);
  auto output = medtrust::schema::hash32_t{};
  blake3_hasher_finalize(&state_->native, output.data(), output.size());
  return output;
}

medtrust::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

medtrust::schema::hash32_t hash(const medtrust::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace medtrust::blake3
