#pragma once

#include <trackchain/execution/state_overlay.hpp>
#include <trackchain/schema/primitives.hpp>
#include <optional>

namespace trackchain::registry {

/// Single owner per product id. Minted once, reassigned on transfer, never
/// burned.
class ownership_token final {
 public:
  explicit ownership_token(trackchain::execution::state_overlay& state);

  std::optional<trackchain::schema::identity_t> owner_of(
      const trackchain::schema::product_id_t& product_id) const;

  void mint(const trackchain::schema::product_id_t& product_id,
            const trackchain::schema::identity_t& owner);

  void reassign(const trackchain::schema::product_id_t& product_id,
                const trackchain::schema::identity_t& new_owner);

 private:
  trackchain::execution::state_overlay& state_;
};

}  // namespace trackchain::registry
