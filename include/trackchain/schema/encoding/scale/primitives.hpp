#pragma once
#include <trackchain/schema/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace trackchain::schema::encoding::scale {

void encode(ed25519_identity&& o, ::scale::Encoder& encoder);
void decode(ed25519_identity&& o, ::scale::Decoder& decoder);

void encode(secp256k1_identity&& o, ::scale::Encoder& encoder);
void decode(secp256k1_identity&& o, ::scale::Decoder& decoder);

}  // namespace trackchain::schema::encoding::scale
