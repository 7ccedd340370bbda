#pragma once

#include <trackchain/schema/create_product.hpp>
#include <scale/scale.hpp>

namespace trackchain::schema::encoding::scale {

void encode(trackchain::schema::create_product<1>&& o, ::scale::Encoder& encoder);
void decode(trackchain::schema::create_product<1>&& o, ::scale::Decoder& decoder);

}  // namespace trackchain::schema::encoding::scale
