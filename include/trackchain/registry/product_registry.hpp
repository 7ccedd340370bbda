#pragma once

#include <trackchain/execution/state_overlay.hpp>
#include <trackchain/schema/product_state.hpp>
#include <optional>

namespace trackchain::registry {

/// Product id to descriptive record. A record is written once and never
/// replaced.
class product_registry final {
 public:
  explicit product_registry(trackchain::execution::state_overlay& state);

  bool exists(const trackchain::schema::product_id_t& product_id) const;

  std::optional<trackchain::schema::product_state_t> get(
      const trackchain::schema::product_id_t& product_id) const;

  void create(const trackchain::schema::product_state_t& product);

 private:
  trackchain::execution::state_overlay& state_;
};

}  // namespace trackchain::registry
