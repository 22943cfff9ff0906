#pragma once

#include <strongbox/schema/pause_state.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(strongbox::schema,
                             pause_state_t,
                             strongbox::schema::pause_state_t::active,
                             strongbox::schema::pause_state_t::paused)
