#pragma once

#include <trackchain/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace trackchain::schema {

template <uint16_t Version>
struct create_product;

template <>
struct create_product<1> final {
  uint16_t version{1};
  product_id_t product_id{};
  std::string name;
  std::string content_hash;
};

using create_product_t = create_product<1>;

}  // namespace trackchain::schema
