#pragma once

#include <trackchain/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace trackchain::schema {

template <uint16_t Version>
struct transfer_ownership;

template <>
struct transfer_ownership<1> final {
  uint16_t version{1};
  product_id_t product_id{};
  identity_t new_owner{};
  std::string content_hash;
};

using transfer_ownership_t = transfer_ownership<1>;

}  // namespace trackchain::schema
