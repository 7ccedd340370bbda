#include <trackchain/schema/encoding/scale/primitives.hpp>
#include <trackchain/schema/encoding/scale/transfer_ownership.hpp>

using namespace trackchain::schema;

namespace trackchain::schema::encoding::scale {

void encode(transfer_ownership<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.product_id, encoder);
  encode(o.new_owner, encoder);
  encode(o.content_hash, encoder);
}

void decode(transfer_ownership<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.product_id, decoder);
  decode(o.new_owner, decoder);
  decode(o.content_hash, decoder);
}

}  // namespace trackchain::schema::encoding::scale
