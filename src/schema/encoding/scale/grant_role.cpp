#include <trackchain/schema/encoding/scale/grant_role.hpp>
#include <trackchain/schema/encoding/scale/primitives.hpp>
#include <trackchain/schema/encoding/scale/role_id.hpp>

using namespace trackchain::schema;

namespace trackchain::schema::encoding::scale {

void encode(grant_role<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.subject, encoder);
  encode(o.role, encoder);
}

void decode(grant_role<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.subject, decoder);
  decode(o.role, decoder);
}

}  // namespace trackchain::schema::encoding::scale
