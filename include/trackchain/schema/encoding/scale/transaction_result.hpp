#pragma once

#include <trackchain/schema/transaction_result.hpp>
#include <scale/scale.hpp>

namespace trackchain::schema::encoding::scale {

void encode(trackchain::schema::transaction_result<1>&& o, ::scale::Encoder& encoder);
void decode(trackchain::schema::transaction_result<1>&& o, ::scale::Decoder& decoder);

}  // namespace trackchain::schema::encoding::scale
