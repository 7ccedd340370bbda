#pragma once

#include <trackchain/schema/custody_event_record.hpp>
#include <scale/scale.hpp>

namespace trackchain::schema::encoding::scale {

void encode(trackchain::schema::custody_event_record<1>&& o, ::scale::Encoder& encoder);
void decode(trackchain::schema::custody_event_record<1>&& o, ::scale::Decoder& decoder);

}  // namespace trackchain::schema::encoding::scale
