#include <trackchain/schema/encoding/scale/custody_event_record.hpp>
#include <trackchain/schema/encoding/scale/custody_event_type.hpp>
#include <trackchain/schema/encoding/scale/primitives.hpp>

using namespace trackchain::schema;

namespace trackchain::schema::encoding::scale {

void encode(custody_event_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_id, encoder);
  encode(o.height, encoder);
  encode(o.tx_index, encoder);
  encode(o.type, encoder);
  encode(o.product_id, encoder);
  encode(o.actor, encoder);
  encode(o.counterparty, encoder);
  encode(o.content_hash, encoder);
  encode(o.recorded_at, encoder);
}

void decode(custody_event_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_id, decoder);
  decode(o.height, decoder);
  decode(o.tx_index, decoder);
  decode(o.type, decoder);
  decode(o.product_id, decoder);
  decode(o.actor, decoder);
  decode(o.counterparty, decoder);
  decode(o.content_hash, decoder);
  decode(o.recorded_at, decoder);
}

}  // namespace trackchain::schema::encoding::scale
