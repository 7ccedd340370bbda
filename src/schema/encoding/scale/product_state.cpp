#include <trackchain/schema/encoding/scale/primitives.hpp>
#include <trackchain/schema/encoding/scale/product_state.hpp>

using namespace trackchain::schema;

namespace trackchain::schema::encoding::scale {

void encode(product_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.product_id, encoder);
  encode(o.name, encoder);
  encode(o.content_hash, encoder);
  encode(o.manufacturer, encoder);
  encode(o.created_at, encoder);
}

void decode(product_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.product_id, decoder);
  decode(o.name, decoder);
  decode(o.content_hash, decoder);
  decode(o.manufacturer, decoder);
  decode(o.created_at, decoder);
}

}  // namespace trackchain::schema::encoding::scale
