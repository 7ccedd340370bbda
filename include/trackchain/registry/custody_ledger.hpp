#pragma once

#include <trackchain/execution/state_overlay.hpp>
#include <trackchain/schema/custody_entry.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace trackchain::registry {

/// Append-only custody trail per product id. Entry `i` lives under the
/// product's prefix with a big endian index suffix, so a prefix scan returns
/// the trail in insertion order.
class custody_ledger final {
 public:
  explicit custody_ledger(trackchain::execution::state_overlay& state);

  uint64_t size(const trackchain::schema::product_id_t& product_id) const;

  /// Returns the index of the appended entry.
  uint64_t append(const trackchain::schema::product_id_t& product_id,
                  const trackchain::schema::custody_entry_t& entry);

  std::optional<trackchain::schema::custody_entry_t> last(
      const trackchain::schema::product_id_t& product_id) const;

  std::vector<trackchain::schema::custody_entry_t> history(
      const trackchain::schema::product_id_t& product_id) const;

  std::vector<trackchain::schema::custody_entry_t> history(
      const trackchain::schema::product_id_t& product_id,
      uint64_t offset,
      uint64_t limit) const;

 private:
  trackchain::execution::state_overlay& state_;
};

}  // namespace trackchain::registry
