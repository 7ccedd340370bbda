#pragma once

#include <trackchain/schema/custody_action.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(trackchain::schema,
                             custody_action_t,
                             trackchain::schema::custody_action_t::created,
                             trackchain::schema::custody_action_t::in_transit,
                             trackchain::schema::custody_action_t::received,
                             trackchain::schema::custody_action_t::sold)
