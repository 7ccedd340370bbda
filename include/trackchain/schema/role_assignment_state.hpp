#pragma once

#include <trackchain/schema/primitives.hpp>
#include <trackchain/schema/role_id.hpp>
#include <cstdint>

namespace trackchain::schema {

template <uint16_t Version>
struct role_assignment_state;

template <>
struct role_assignment_state<1> final {
  uint16_t version{1};
  identity_t subject{};
  role_id_t role{role_id_t::manufacturer};
  bool enabled{true};
  identity_t updated_by{};
  timestamp_milliseconds_t updated_at{};
};

using role_assignment_state_t = role_assignment_state<1>;

}  // namespace trackchain::schema
