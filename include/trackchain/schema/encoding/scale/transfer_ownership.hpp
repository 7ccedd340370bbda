#pragma once

#include <trackchain/schema/transfer_ownership.hpp>
#include <scale/scale.hpp>

namespace trackchain::schema::encoding::scale {

void encode(trackchain::schema::transfer_ownership<1>&& o, ::scale::Encoder& encoder);
void decode(trackchain::schema::transfer_ownership<1>&& o, ::scale::Decoder& decoder);

}  // namespace trackchain::schema::encoding::scale
