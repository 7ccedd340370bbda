#include <trackchain/schema/encoding/scale/create_product.hpp>
#include <trackchain/schema/encoding/scale/grant_role.hpp>
#include <trackchain/schema/encoding/scale/primitives.hpp>
#include <trackchain/schema/encoding/scale/revoke_role.hpp>
#include <trackchain/schema/encoding/scale/transaction.hpp>
#include <trackchain/schema/encoding/scale/transfer_ownership.hpp>
#include <trackchain/schema/encoding/scale/verify_receive.hpp>

using namespace trackchain::schema;

namespace trackchain::schema::encoding::scale {

void encode(transaction<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.nonce, encoder);
  encode(o.signer, encoder);
  encode(o.payload, encoder);
  encode(o.signature, encoder);
}

void decode(transaction<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.nonce, decoder);
  decode(o.signer, decoder);
  decode(o.payload, decoder);
  decode(o.signature, decoder);
}

}  // namespace trackchain::schema::encoding::scale
