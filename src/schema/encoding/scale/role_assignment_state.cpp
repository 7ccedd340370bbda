#include <trackchain/schema/encoding/scale/primitives.hpp>
#include <trackchain/schema/encoding/scale/role_assignment_state.hpp>
#include <trackchain/schema/encoding/scale/role_id.hpp>

using namespace trackchain::schema;

namespace trackchain::schema::encoding::scale {

void encode(role_assignment_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.subject, encoder);
  encode(o.role, encoder);
  encode(o.enabled, encoder);
  encode(o.updated_by, encoder);
  encode(o.updated_at, encoder);
}

void decode(role_assignment_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.subject, decoder);
  decode(o.role, decoder);
  decode(o.enabled, decoder);
  decode(o.updated_by, decoder);
  decode(o.updated_at, decoder);
}

}  // namespace trackchain::schema::encoding::scale
