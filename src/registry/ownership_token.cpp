#include <trackchain/common/critical.hpp>
#include <trackchain/registry/ownership_token.hpp>
#include <trackchain/schema/key/engine_keys.hpp>

using namespace trackchain::schema;

namespace trackchain::registry {

ownership_token::ownership_token(trackchain::execution::state_overlay& state)
    : state_{state} {}

std::optional<identity_t> ownership_token::owner_of(
    const product_id_t& product_id) const {
  auto key = key::make_owner_key(state_.encoder(), product_id);
  return state_.get<identity_t>(key);
}

void ownership_token::mint(const product_id_t& product_id,
                           const identity_t& owner) {
  if (owner_of(product_id).has_value()) {
    trackchain::common::critical("ownership token {} already minted",
                                 to_string(product_id));
  }
  auto key = key::make_owner_key(state_.encoder(), product_id);
  state_.put(key, owner);
}

void ownership_token::reassign(const product_id_t& product_id,
                               const identity_t& new_owner) {
  if (!owner_of(product_id).has_value()) {
    trackchain::common::critical("ownership token {} was never minted",
                                 to_string(product_id));
  }
  auto key = key::make_owner_key(state_.encoder(), product_id);
  state_.put(key, new_owner);
}

}  // namespace trackchain::registry
