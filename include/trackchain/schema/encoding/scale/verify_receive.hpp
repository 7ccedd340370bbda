#pragma once

#include <trackchain/schema/verify_receive.hpp>
#include <scale/scale.hpp>

namespace trackchain::schema::encoding::scale {

void encode(trackchain::schema::verify_receive<1>&& o, ::scale::Encoder& encoder);
void decode(trackchain::schema::verify_receive<1>&& o, ::scale::Decoder& decoder);

}  // namespace trackchain::schema::encoding::scale
