#include <trackchain/registry/identity_registry.hpp>
#include <trackchain/schema/key/engine_keys.hpp>

using namespace trackchain::schema;

namespace trackchain::registry {

identity_registry::identity_registry(
    trackchain::execution::state_overlay& state)
    : state_{state} {}

bool identity_registry::has_role(const identity_t& subject,
                                 const role_id_t role) const {
  auto row = assignment(subject, role);
  return row.has_value() && row->enabled;
}

std::optional<role_assignment_state_t> identity_registry::assignment(
    const identity_t& subject,
    const role_id_t role) const {
  auto key = key::make_role_key(state_.encoder(), subject, role);
  return state_.get<role_assignment_state_t>(key);
}

void identity_registry::assign(const identity_t& subject,
                               const role_id_t role,
                               const bool enabled,
                               const identity_t& updated_by,
                               const timestamp_milliseconds_t updated_at) {
  auto key = key::make_role_key(state_.encoder(), subject, role);
  state_.put(key, role_assignment_state_t{.subject = subject,
                                          .role = role,
                                          .enabled = enabled,
                                          .updated_by = updated_by,
                                          .updated_at = updated_at});
}

}  // namespace trackchain::registry
