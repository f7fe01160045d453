
#include "stdinc.hpp"

#include "error-kind.hpp"

namespace anthro
{
#define E_LIST                                \
   E(MISSING_JOINT, "MissingJoint")           \
   E(LOW_CONFIDENCE, "LowConfidence")         \
   E(OUT_OF_BOUNDS, "OutOfBounds")            \
   E(INVALID_CALIBRATION, "InvalidCalibration") \
   E(DEGENERATE_MEASUREMENT, "DegenerateMeasurement") \
   E(CONFLICTING_MEASUREMENT, "ConflictingMeasurement") \
   E(OUT_OF_SUPPORTED_RANGE, "OutOfSupportedRange") \
   E(RETAKES_EXHAUSTED, "RetakesExhausted")

const char* str(const ErrorKind x) noexcept
{
   switch(x) {
#define E(x, s) \
   case ErrorKind::x: return s;
      E_LIST
#undef E
   }
   return "<unknown>";
}

ErrorKind to_error_kind(const string_view val) noexcept(false)
{
#define E(x, s) \
   if(val == s) return ErrorKind::x;
   E_LIST
#undef E
   throw std::runtime_error(format("could not convert '{}' to an error kind", val));
}

#undef E_LIST

} // namespace anthro
