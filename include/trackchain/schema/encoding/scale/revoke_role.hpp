#pragma once

#include <trackchain/schema/revoke_role.hpp>
#include <scale/scale.hpp>

namespace trackchain::schema::encoding::scale {

void encode(trackchain::schema::revoke_role<1>&& o, ::scale::Encoder& encoder);
void decode(trackchain::schema::revoke_role<1>&& o, ::scale::Decoder& decoder);

}  // namespace trackchain::schema::encoding::scale
