#pragma once
#include <trackchain/schema/primitives.hpp>
#include <optional>
#include <vector>

namespace trackchain::storage {

using key_value_entry_t =
    std::pair<trackchain::schema::bytes_t, trackchain::schema::bytes_t>;

/// Last committed block checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  trackchain::schema::hash32_t state_root;
  trackchain::schema::timestamp_milliseconds_t block_time{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const trackchain::schema::bytes_view_t& key) const;

  /// Return the raw bytes at key, or std::nullopt when missing.
  std::optional<trackchain::schema::bytes_t> get_bytes(
      const trackchain::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const trackchain::schema::bytes_view_t& key,
           const T& value);

  /// Load the most recent committed checkpoint.
  std::optional<committed_state> load_committed_state() const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const trackchain::schema::bytes_view_t& prefix) const;

  /// Atomically write entries together with the new checkpoint.
  void commit_batch(const std::vector<key_value_entry_t>& entries,
                    const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace trackchain::storage
