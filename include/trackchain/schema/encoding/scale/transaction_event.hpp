#pragma once

#include <trackchain/schema/transaction_event.hpp>
#include <scale/scale.hpp>

namespace trackchain::schema::encoding::scale {

void encode(trackchain::schema::transaction_event_attribute<1>&& o,
            ::scale::Encoder& encoder);
void decode(trackchain::schema::transaction_event_attribute<1>&& o,
            ::scale::Decoder& decoder);

void encode(trackchain::schema::transaction_event<1>&& o, ::scale::Encoder& encoder);
void decode(trackchain::schema::transaction_event<1>&& o, ::scale::Decoder& decoder);

}  // namespace trackchain::schema::encoding::scale
