#ifndef MOCAP_2D__x__STDINC_HPP
#define MOCAP_2D__x__STDINC_HPP

// Keep this small
#include "mocap/foundation.hpp"

#ifdef __cplusplus

#include "mocap/utils/string-utils.hpp"
#include "mocap/utils/tick-tock.hpp"

#include <string_view>

#endif

#endif
