#pragma once

#include <trackchain/schema/app_info.hpp>
#include <scale/scale.hpp>

namespace trackchain::schema::encoding::scale {

void encode(trackchain::schema::app_info<1>&& o, ::scale::Encoder& encoder);
void decode(trackchain::schema::app_info<1>&& o, ::scale::Decoder& decoder);

}  // namespace trackchain::schema::encoding::scale
