#pragma once

#include <trackchain/schema/role_assignment_state.hpp>
#include <scale/scale.hpp>

namespace trackchain::schema::encoding::scale {

void encode(trackchain::schema::role_assignment_state<1>&& o, ::scale::Encoder& encoder);
void decode(trackchain::schema::role_assignment_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace trackchain::schema::encoding::scale
