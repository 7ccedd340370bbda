#pragma once

#include <trackchain/schema/primitives.hpp>
#include <trackchain/schema/role_id.hpp>
#include <cstdint>

namespace trackchain::schema {

template <uint16_t Version>
struct grant_role;

template <>
struct grant_role<1> final {
  uint16_t version{1};
  identity_t subject{};
  role_id_t role{role_id_t::manufacturer};
};

using grant_role_t = grant_role<1>;

}  // namespace trackchain::schema
