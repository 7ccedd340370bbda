#pragma once

#include <trackchain/schema/role_id.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(trackchain::schema,
                             role_id_t,
                             trackchain::schema::role_id_t::admin,
                             trackchain::schema::role_id_t::manufacturer)
