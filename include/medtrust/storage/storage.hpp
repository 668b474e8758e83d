#pragma once
#include <medtrust/schema/primitives.hpp>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace medtrust::storage {

/// Raised when the backing store cannot serve a read or write (closed
/// database, I/O error, busy). Corrupt contents are not reported this way.
class storage_unavailable final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

using key_value_entry_t =
    std::pair<medtrust::schema::bytes_t, medtrust::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const medtrust::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const medtrust::schema::bytes_view_t& key,
           const T& value) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const medtrust::schema::bytes_view_t& prefix) const;

  /// Atomically write all entries.
  void put_batch(const std::vector<key_value_entry_t>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace medtrust::storage
