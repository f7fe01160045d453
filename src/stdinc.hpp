
#ifndef ANTHRO__x__STDINC_HPP
#define ANTHRO__x__STDINC_HPP

// Keep this small
#include "anthro/foundation.hpp"

#ifdef __cplusplus

#include "anthro/utils/math.hpp"
#include "anthro/utils/string-utils.hpp"
#include "anthro/utils/threads.hpp"
#include "anthro/utils/tick-tock.hpp"

#include "anthro/geometry/vector.hpp"
#include <string_view>

#endif

#endif
