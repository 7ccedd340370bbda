#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <trackchain/common/critical.hpp>
#include <trackchain/schema/encoding/scale/encoder.hpp>
#include <trackchain/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <scale/scale.hpp>
#include <string_view>

namespace trackchain::storage {

namespace detail {

using encoder_t = trackchain::schema::encoding::encoder<
    trackchain::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED_STATE"};

inline trackchain::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const trackchain::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const trackchain::schema::bytes_view_t& key) const;

  std::optional<trackchain::schema::bytes_t> get_bytes(
      const trackchain::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const trackchain::schema::bytes_view_t& key,
           const T& value);

  std::optional<committed_state> load_committed_state() const;
  std::vector<key_value_entry_t> list_by_prefix(
      const trackchain::schema::bytes_view_t& prefix) const;
  void commit_batch(const std::vector<key_value_entry_t>& entries,
                    const committed_state& state) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<trackchain::schema::bytes_t>
storage<rocksdb_storage_tag>::get_bytes(
    const trackchain::schema::bytes_view_t& key) const {
  if (!database) {
    trackchain::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    trackchain::common::critical("Failed to get value from RocksDB");
  }
  return trackchain::schema::bytes_t{std::begin(value), std::end(value)};
}

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const trackchain::schema::bytes_view_t& key) const {
  auto value = get_bytes(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(trackchain::schema::bytes_view_t{
      value->data(), value->size()})};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const trackchain::schema::bytes_view_t& key,
    const T& value) {
  if (!database) {
    trackchain::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(trackchain::schema::bytes_view_t{encoded_value}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    trackchain::common::critical("Failed to put value into RocksDB");
  }
}

}  // namespace trackchain::storage
