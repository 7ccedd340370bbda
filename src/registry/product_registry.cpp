#include <trackchain/common/critical.hpp>
#include <trackchain/registry/product_registry.hpp>
#include <trackchain/schema/key/engine_keys.hpp>

using namespace trackchain::schema;

namespace trackchain::registry {

product_registry::product_registry(trackchain::execution::state_overlay& state)
    : state_{state} {}

bool product_registry::exists(const product_id_t& product_id) const {
  auto key = key::make_product_key(state_.encoder(), product_id);
  return state_.get_bytes(key).has_value();
}

std::optional<product_state_t> product_registry::get(
    const product_id_t& product_id) const {
  auto key = key::make_product_key(state_.encoder(), product_id);
  return state_.get<product_state_t>(key);
}

void product_registry::create(const product_state_t& product) {
  if (exists(product.product_id)) {
    trackchain::common::critical("product {} already registered",
                                 to_string(product.product_id));
  }
  auto key = key::make_product_key(state_.encoder(), product.product_id);
  state_.put(key, product);
}

}  // namespace trackchain::registry
