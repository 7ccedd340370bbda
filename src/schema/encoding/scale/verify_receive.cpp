#include <trackchain/schema/encoding/scale/verify_receive.hpp>

using namespace trackchain::schema;

namespace trackchain::schema::encoding::scale {

void encode(verify_receive<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.product_id, encoder);
  encode(o.content_hash, encoder);
}

void decode(verify_receive<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.product_id, decoder);
  decode(o.content_hash, decoder);
}

}  // namespace trackchain::schema::encoding::scale
