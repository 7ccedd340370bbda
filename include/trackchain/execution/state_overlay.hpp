#pragma once

#include <trackchain/schema/encoding/scale/encoder.hpp>
#include <trackchain/schema/primitives.hpp>
#include <trackchain/storage/rocksdb/storage.hpp>
#include <map>
#include <optional>
#include <vector>

namespace trackchain::execution {

using encoder_t = trackchain::schema::encoding::encoder<
    trackchain::schema::encoding::scale_encoder_tag>;
using storage_t =
    trackchain::storage::storage<trackchain::storage::rocksdb_storage_tag>;

/// Uncommitted key/value writes, ordered the same way RocksDB orders keys.
using write_set_t =
    std::map<trackchain::schema::bytes_t, trackchain::schema::bytes_t>;

/// Private write set layered over an optional parent write set and the
/// committed store. Reads fall through own writes, then the parent, then
/// storage. Nothing reaches storage until the owner hands the writes back.
class state_overlay final {
 public:
  state_overlay(encoder_t& encoder,
                const storage_t& storage,
                const write_set_t* parent = nullptr);

  std::optional<trackchain::schema::bytes_t> get_bytes(
      const trackchain::schema::bytes_view_t& key) const;

  void put_bytes(trackchain::schema::bytes_t key,
                 trackchain::schema::bytes_t value);

  template <typename T>
  std::optional<T> get(const trackchain::schema::bytes_view_t& key) const;

  template <typename T>
  void put(const trackchain::schema::bytes_view_t& key, const T& value);

  /// Merged view of every visible entry under prefix, in key order.
  std::vector<trackchain::storage::key_value_entry_t> list_by_prefix(
      const trackchain::schema::bytes_view_t& prefix) const;

  encoder_t& encoder() const { return encoder_; }
  const write_set_t& writes() const { return writes_; }
  write_set_t take_writes();

 private:
  encoder_t& encoder_;
  const storage_t& storage_;
  const write_set_t* parent_;
  write_set_t writes_;
};

template <typename T>
std::optional<T> state_overlay::get(
    const trackchain::schema::bytes_view_t& key) const {
  auto raw = get_bytes(key);
  if (!raw) {
    return std::nullopt;
  }
  return encoder_.decode<T>(
      trackchain::schema::bytes_view_t{raw->data(), raw->size()});
}

template <typename T>
void state_overlay::put(const trackchain::schema::bytes_view_t& key,
                        const T& value) {
  put_bytes(trackchain::schema::make_bytes(key), encoder_.encode(value));
}

}  // namespace trackchain::execution
