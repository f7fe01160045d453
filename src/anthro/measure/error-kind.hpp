
#pragma once

#include "anthro/foundation.hpp"

namespace anthro
{
enum class ErrorKind : int8_t {
   MISSING_JOINT = 0,        // validation
   LOW_CONFIDENCE,           // validation
   OUT_OF_BOUNDS,            // validation
   INVALID_CALIBRATION,      // calibration
   DEGENERATE_MEASUREMENT,   // computation, a zero or non-finite field
   CONFLICTING_MEASUREMENT,  // aggregation, a flag
   OUT_OF_SUPPORTED_RANGE,   // mesh parametrization, a warning
   RETAKES_EXHAUSTED         // verification, terminal
};

const char* str(const ErrorKind) noexcept; // "MissingJoint", ...
ErrorKind to_error_kind(const string_view val) noexcept(false);

} // namespace anthro
