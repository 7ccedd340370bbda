#pragma once

#include <trackchain/execution/state_overlay.hpp>
#include <trackchain/registry/custody_ledger.hpp>
#include <trackchain/registry/identity_registry.hpp>
#include <trackchain/registry/ownership_token.hpp>
#include <trackchain/registry/product_registry.hpp>
#include <trackchain/schema/custody_event_record.hpp>
#include <vector>

namespace trackchain::execution {

/// The four custody stores plus staged notifications, all sharing one private
/// write set. Dropping the aggregate discards every change made through it.
class custody_state final {
 public:
  custody_state(encoder_t& encoder,
                const storage_t& storage,
                const write_set_t* parent = nullptr);

  custody_state(const custody_state&) = delete;
  custody_state& operator=(const custody_state&) = delete;

  trackchain::registry::identity_registry& identities() { return identities_; }
  trackchain::registry::product_registry& products() { return products_; }
  trackchain::registry::ownership_token& ownership() { return ownership_; }
  trackchain::registry::custody_ledger& ledger() { return ledger_; }
  state_overlay& overlay() { return overlay_; }

  /// Assigns the next event id, persists the record and returns the id.
  uint64_t stage_event(trackchain::schema::custody_event_record_t record);

  const std::vector<trackchain::schema::custody_event_record_t>&
  staged_events() const {
    return staged_events_;
  }

 private:
  state_overlay overlay_;
  trackchain::registry::identity_registry identities_;
  trackchain::registry::product_registry products_;
  trackchain::registry::ownership_token ownership_;
  trackchain::registry::custody_ledger ledger_;
  std::vector<trackchain::schema::custody_event_record_t> staged_events_;
};

}  // namespace trackchain::execution
