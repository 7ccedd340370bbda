#pragma once

#include <trackchain/schema/history_entry.hpp>
#include <scale/scale.hpp>

// History rows are stored as written; the field order is part of the
// on-disk format of the SYS|HISTORY|TX| keyspace.
namespace trackchain::schema::encoding::scale {

void encode(trackchain::schema::history_entry<1>&& o, ::scale::Encoder& encoder);
void decode(trackchain::schema::history_entry<1>&& o, ::scale::Decoder& decoder);

}  // namespace trackchain::schema::encoding::scale
