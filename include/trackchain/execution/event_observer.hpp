#pragma once

#include <trackchain/schema/custody_event_record.hpp>
#include <functional>

namespace trackchain::execution {

/// Called once per custody event after the block carrying it is committed.
/// Exceptions are logged by the engine and do not affect committed state.
using event_observer_t =
    std::function<void(const trackchain::schema::custody_event_record_t&)>;

}  // namespace trackchain::execution
