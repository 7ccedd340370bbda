#pragma once
#include <trackchain/common/critical.hpp>
#include <trackchain/schema/encoding/encoder.hpp>
#include <trackchain/schema/encoding/scale/app_info.hpp>
#include <trackchain/schema/encoding/scale/create_product.hpp>
#include <trackchain/schema/encoding/scale/custody_action.hpp>
#include <trackchain/schema/encoding/scale/custody_entry.hpp>
#include <trackchain/schema/encoding/scale/custody_event_record.hpp>
#include <trackchain/schema/encoding/scale/custody_event_type.hpp>
#include <trackchain/schema/encoding/scale/genesis_state.hpp>
#include <trackchain/schema/encoding/scale/grant_role.hpp>
#include <trackchain/schema/encoding/scale/history_entry.hpp>
#include <trackchain/schema/encoding/scale/primitives.hpp>
#include <trackchain/schema/encoding/scale/product_state.hpp>
#include <trackchain/schema/encoding/scale/revoke_role.hpp>
#include <trackchain/schema/encoding/scale/role_assignment_state.hpp>
#include <trackchain/schema/encoding/scale/role_id.hpp>
#include <trackchain/schema/encoding/scale/transaction.hpp>
#include <trackchain/schema/encoding/scale/transaction_event.hpp>
#include <trackchain/schema/encoding/scale/transaction_result.hpp>
#include <trackchain/schema/encoding/scale/transfer_ownership.hpp>
#include <trackchain/schema/encoding/scale/verify_receive.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace trackchain::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  trackchain::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, trackchain::schema::bytes_t& out);

  template <typename T>
  T decode(const trackchain::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const trackchain::schema::bytes_view_t& bytes);
};

template <typename T>
trackchain::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    trackchain::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        trackchain::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const trackchain::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    trackchain::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const trackchain::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace trackchain::schema::encoding
