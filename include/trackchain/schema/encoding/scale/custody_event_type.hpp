#pragma once

#include <trackchain/schema/custody_event_type.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    trackchain::schema,
    custody_event_type_t,
    trackchain::schema::custody_event_type_t::product_created,
    trackchain::schema::custody_event_type_t::ownership_transferred,
    trackchain::schema::custody_event_type_t::custody_received)
