#pragma once

#include <trackchain/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace trackchain::schema {

template <uint16_t Version>
struct verify_receive;

template <>
struct verify_receive<1> final {
  uint16_t version{1};
  product_id_t product_id{};
  std::string content_hash;
};

using verify_receive_t = verify_receive<1>;

}  // namespace trackchain::schema
