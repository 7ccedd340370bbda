#pragma once

#include <trackchain/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: product state.
// Custody workflow: descriptive record of a tracked good. `content_hash` is
// the opaque reference returned by the off-chain metadata service.
namespace trackchain::schema {

template <uint16_t Version>
struct product_state;

template <>
struct product_state<1> final {
  uint16_t version{1};
  product_id_t product_id{};
  std::string name;
  std::string content_hash;
  identity_t manufacturer{};
  timestamp_milliseconds_t created_at{};
};

using product_state_t = product_state<1>;

}  // namespace trackchain::schema
