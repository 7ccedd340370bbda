#include <trackchain/schema/encoding/scale/custody_action.hpp>
#include <trackchain/schema/encoding/scale/custody_entry.hpp>
#include <trackchain/schema/encoding/scale/primitives.hpp>

using namespace trackchain::schema;

namespace trackchain::schema::encoding::scale {

void encode(custody_entry<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.actor, encoder);
  encode(o.counterparty, encoder);
  encode(o.timestamp, encoder);
  encode(o.action, encoder);
  encode(o.content_hash, encoder);
}

void decode(custody_entry<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.actor, decoder);
  decode(o.counterparty, decoder);
  decode(o.timestamp, decoder);
  decode(o.action, decoder);
  decode(o.content_hash, decoder);
}

}  // namespace trackchain::schema::encoding::scale
