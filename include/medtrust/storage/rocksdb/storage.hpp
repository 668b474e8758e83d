#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <medtrust/common/critical.hpp>
#include <medtrust/schema/encoding/scale/encoder.hpp>
#include <medtrust/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace medtrust::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const medtrust::schema::bytes_view_t& bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

inline medtrust::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const medtrust::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const medtrust::schema::bytes_view_t& key,
           const T& value) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const medtrust::schema::bytes_view_t& prefix) const;
  void put_batch(const std::vector<key_value_entry_t>& entries) const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const medtrust::schema::bytes_view_t& key) const {
  if (!database) {
    throw storage_unavailable{"RocksDB database is not open"};
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    throw storage_unavailable{"RocksDB read failed: " + status.ToString()};
  }
  auto decoded = encoder.template try_decode<T>(
      medtrust::schema::bytes_view_t{
          reinterpret_cast<const uint8_t*>(value.data()), value.size()});
  if (!decoded.has_value()) {
    medtrust::common::critical("Corrupt value in RocksDB");
  }
  return decoded;
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const medtrust::schema::bytes_view_t& key,
    const T& value) const {
  if (!database) {
    throw storage_unavailable{"RocksDB database is not open"};
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(medtrust::schema::bytes_view_t{encoded_value}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    throw storage_unavailable{"RocksDB write failed: " + status.ToString()};
  }
}

}  // namespace medtrust::storage
