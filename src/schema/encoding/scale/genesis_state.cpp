#include <trackchain/schema/encoding/scale/genesis_state.hpp>
#include <trackchain/schema/encoding/scale/primitives.hpp>

using namespace trackchain::schema;

namespace trackchain::schema::encoding::scale {

void encode(genesis_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.admins, encoder);
  encode(o.genesis_time, encoder);
}

void decode(genesis_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.admins, decoder);
  decode(o.genesis_time, decoder);
}

}  // namespace trackchain::schema::encoding::scale
