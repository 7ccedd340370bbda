#pragma once

#include <trackchain/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema type: genesis state.
// Custody workflow: one-time chain bootstrap naming the chain id and the
// administrator identities.
namespace trackchain::schema {

template <uint16_t Version>
struct genesis_state;

template <>
struct genesis_state<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  std::vector<identity_t> admins;
  timestamp_milliseconds_t genesis_time{};
};

using genesis_state_t = genesis_state<1>;

}  // namespace trackchain::schema
