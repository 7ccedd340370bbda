#pragma once

#include <trackchain/execution/state_overlay.hpp>
#include <trackchain/schema/primitives.hpp>
#include <trackchain/schema/role_assignment_state.hpp>
#include <trackchain/schema/role_id.hpp>
#include <optional>

namespace trackchain::registry {

/// Capability assignments per identity. Rows are never deleted; a revoked
/// capability keeps its row with `enabled = false`.
class identity_registry final {
 public:
  explicit identity_registry(trackchain::execution::state_overlay& state);

  bool has_role(const trackchain::schema::identity_t& subject,
                trackchain::schema::role_id_t role) const;

  std::optional<trackchain::schema::role_assignment_state_t> assignment(
      const trackchain::schema::identity_t& subject,
      trackchain::schema::role_id_t role) const;

  void assign(const trackchain::schema::identity_t& subject,
              trackchain::schema::role_id_t role,
              bool enabled,
              const trackchain::schema::identity_t& updated_by,
              trackchain::schema::timestamp_milliseconds_t updated_at);

 private:
  trackchain::execution::state_overlay& state_;
};

}  // namespace trackchain::registry
