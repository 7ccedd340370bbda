#include <trackchain/schema/encoding/scale/primitives.hpp>

using namespace trackchain::schema;

namespace trackchain::schema::encoding::scale {

void encode(ed25519_identity&& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(ed25519_identity&& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
}

void encode(secp256k1_identity&& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(secp256k1_identity&& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
}

}  // namespace trackchain::schema::encoding::scale
