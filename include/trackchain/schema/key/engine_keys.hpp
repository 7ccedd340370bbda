#pragma once

#include <algorithm>
#include <array>
#include <boost/endian/buffers.hpp>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>
#include <trackchain/schema/primitives.hpp>
#include <trackchain/schema/role_id.hpp>
#include <tuple>
#include <utility>

// Schema key type: engine keys.
// Custody workflow: Defines canonical key prefixes and key codecs for custody
// state, transaction history, and the committed event log.
namespace trackchain::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kRoleKeyPrefix{"SYS|STATE|ROLE|"};
inline constexpr std::string_view kProductKeyPrefix{"SYS|STATE|PRODUCT|"};
inline constexpr std::string_view kOwnerKeyPrefix{"SYS|STATE|OWNER|"};
inline constexpr std::string_view kCustodyKeyPrefix{"SYS|STATE|CUSTODY|"};
inline constexpr std::string_view kCustodyLengthKeyPrefix{
    "SYS|STATE|CUSTODY_LEN|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kChainKeyPrefix{"SYS|STATE|CHAIN|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

inline const std::array<std::string_view, 11> kEngineKeyspaces{
    kStatePrefix,          kNonceKeyPrefix,    kRoleKeyPrefix,
    kProductKeyPrefix,     kOwnerKeyPrefix,    kCustodyKeyPrefix,
    kCustodyLengthKeyPrefix, kEventSeqKeyPrefix, kChainKeyPrefix,
    kHistoryPrefix,        kEventPrefix};

// Big endian suffix so that RocksDB iteration order matches numeric order.
inline trackchain::schema::bytes_t make_ordered_suffix(uint64_t value) {
  auto buffer = boost::endian::big_uint64_buf_t{value};
  return trackchain::schema::bytes_t{buffer.data(),
                                     buffer.data() + sizeof(buffer)};
}

inline std::optional<uint64_t> parse_ordered_suffix(
    const trackchain::schema::bytes_view_t& bytes) {
  if (bytes.size() != sizeof(boost::endian::big_uint64_buf_t)) {
    return std::nullopt;
  }
  auto buffer = boost::endian::big_uint64_buf_t{};
  std::copy(std::begin(bytes), std::end(bytes),
            reinterpret_cast<uint8_t*>(&buffer));
  return buffer.value();
}

template <typename Encoder, typename T>
trackchain::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                              std::string_view prefix,
                                              const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
trackchain::schema::bytes_t make_prefix_key(Encoder& encoder,
                                            std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
trackchain::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const trackchain::schema::identity_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

template <typename Encoder>
trackchain::schema::bytes_t make_role_key(
    Encoder& encoder,
    const trackchain::schema::identity_t& subject,
    const trackchain::schema::role_id_t role) {
  return make_prefixed_key(encoder, kRoleKeyPrefix, std::tuple{subject, role});
}

template <typename Encoder>
trackchain::schema::bytes_t make_product_key(
    Encoder& encoder,
    const trackchain::schema::product_id_t& product_id) {
  return make_prefixed_key(encoder, kProductKeyPrefix, product_id);
}

template <typename Encoder>
trackchain::schema::bytes_t make_owner_key(
    Encoder& encoder,
    const trackchain::schema::product_id_t& product_id) {
  return make_prefixed_key(encoder, kOwnerKeyPrefix, product_id);
}

template <typename Encoder>
trackchain::schema::bytes_t make_custody_prefix_key(
    Encoder& encoder,
    const trackchain::schema::product_id_t& product_id) {
  return make_prefixed_key(encoder, kCustodyKeyPrefix, product_id);
}

template <typename Encoder>
trackchain::schema::bytes_t make_custody_key(
    Encoder& encoder,
    const trackchain::schema::product_id_t& product_id,
    uint64_t index) {
  auto key = make_custody_prefix_key(encoder, product_id);
  auto suffix = make_ordered_suffix(index);
  key.insert(std::end(key), std::begin(suffix), std::end(suffix));
  return key;
}

template <typename Encoder>
trackchain::schema::bytes_t make_custody_length_key(
    Encoder& encoder,
    const trackchain::schema::product_id_t& product_id) {
  return make_prefixed_key(encoder, kCustodyLengthKeyPrefix, product_id);
}

template <typename Encoder>
trackchain::schema::bytes_t make_event_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
trackchain::schema::bytes_t make_chain_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kChainKeyPrefix,
                           std::string_view{"GENESIS"});
}

template <typename Encoder>
trackchain::schema::bytes_t make_history_key(Encoder& encoder,
                                             uint64_t height,
                                             uint32_t index) {
  auto key = make_prefix_key(encoder, kHistoryPrefix);
  auto height_suffix = make_ordered_suffix(height);
  auto index_suffix = make_ordered_suffix(index);
  key.insert(std::end(key), std::begin(height_suffix), std::end(height_suffix));
  key.insert(std::end(key), std::begin(index_suffix), std::end(index_suffix));
  return key;
}

template <typename Encoder>
trackchain::schema::bytes_t make_event_key(Encoder& encoder,
                                           uint64_t event_id) {
  auto key = make_prefix_key(encoder, kEventPrefix);
  auto suffix = make_ordered_suffix(event_id);
  key.insert(std::end(key), std::begin(suffix), std::end(suffix));
  return key;
}

template <typename Encoder>
std::optional<std::pair<uint64_t, uint32_t>> parse_history_key(
    Encoder& encoder,
    const trackchain::schema::bytes_view_t& key) {
  auto prefix = make_prefix_key(encoder, kHistoryPrefix);
  auto suffix_size = 2 * sizeof(boost::endian::big_uint64_buf_t);
  if (key.size() != prefix.size() + suffix_size ||
      !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
    return std::nullopt;
  }
  auto height = parse_ordered_suffix(key.subspan(prefix.size(), 8));
  auto index = parse_ordered_suffix(key.subspan(prefix.size() + 8, 8));
  if (!height || !index) {
    return std::nullopt;
  }
  return std::pair{height.value(), static_cast<uint32_t>(index.value())};
}

template <typename Encoder>
std::optional<uint64_t> parse_event_key(
    Encoder& encoder,
    const trackchain::schema::bytes_view_t& key) {
  auto prefix = make_prefix_key(encoder, kEventPrefix);
  if (key.size() <= prefix.size() ||
      !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
    return std::nullopt;
  }
  return parse_ordered_suffix(key.subspan(prefix.size()));
}

}  // namespace trackchain::schema::key
