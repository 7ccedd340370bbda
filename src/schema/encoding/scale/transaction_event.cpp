#include <trackchain/schema/encoding/scale/transaction_event.hpp>

using namespace trackchain::schema;

namespace trackchain::schema::encoding::scale {

void encode(transaction_event_attribute<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.key, encoder);
  encode(o.value, encoder);
  encode(o.index, encoder);
}

void decode(transaction_event_attribute<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.key, decoder);
  decode(o.value, decoder);
  decode(o.index, decoder);
}

void encode(transaction_event<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.type, encoder);
  encode(o.attributes, encoder);
}

void decode(transaction_event<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.type, decoder);
  decode(o.attributes, decoder);
}

}  // namespace trackchain::schema::encoding::scale
