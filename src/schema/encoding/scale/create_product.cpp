#include <trackchain/schema/encoding/scale/create_product.hpp>

using namespace trackchain::schema;

namespace trackchain::schema::encoding::scale {

void encode(create_product<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.product_id, encoder);
  encode(o.name, encoder);
  encode(o.content_hash, encoder);
}

void decode(create_product<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.product_id, decoder);
  decode(o.name, decoder);
  decode(o.content_hash, decoder);
}

}  // namespace trackchain::schema::encoding::scale
