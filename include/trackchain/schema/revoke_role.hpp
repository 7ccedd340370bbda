#pragma once

#include <trackchain/schema/primitives.hpp>
#include <trackchain/schema/role_id.hpp>
#include <cstdint>

namespace trackchain::schema {

template <uint16_t Version>
struct revoke_role;

template <>
struct revoke_role<1> final {
  uint16_t version{1};
  identity_t subject{};
  role_id_t role{role_id_t::manufacturer};
};

using revoke_role_t = revoke_role<1>;

}  // namespace trackchain::schema
