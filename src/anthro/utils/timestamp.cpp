
#include "stdinc.hpp"

#include "timestamp.hpp"

#include <cctype>
#include <time.h>

#define This Timestamp

namespace anthro
{
// ------------------------------------------------------------------------- Set

void This::set(const system_clock_time_point& when) noexcept
{
   x = std::chrono::duration_cast<std::chrono::microseconds>(
           when.time_since_epoch())
           .count();
}

// ------------------------------------------------------------------- To String

std::string This::to_string() const noexcept
{
   const std::time_t t = std::time_t(seconds_from_epoch());
   std::tm tm;
   gmtime_r(&t, &tm);
   return format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:06d}",
                 tm.tm_year + 1900,
                 tm.tm_mon + 1,
                 tm.tm_mday,
                 tm.tm_hour,
                 tm.tm_min,
                 tm.tm_sec,
                 micros());
}

// ----------------------------------------------------------------------- Parse

Timestamp This::parse(const std::string_view s) noexcept(false)
{
   // 0123456789.123456789.12345
   // 2026-04-11T21:35:56.356193
   if(s.size() != 19 and s.size() != 26) {
      throw std::runtime_error(format("parse error: timestamp string "
                                      "'{}' length is {}, but must be "
                                      "19 or 26 characters long",
                                      s,
                                      s.size()));
   }

   for(auto i = 0u; i < s.size(); ++i) {
      const char c = s[i];
      const bool ok
          = (i == 4 or i == 7)     ? (c == '-')
            : (i == 13 or i == 16) ? (c == ':')
            : (i == 10)            ? (c == 'T' or c == 't')
            : (i == 19)            ? (c == '.')
                                   : bool(std::isdigit(c));
      if(!ok)
         throw std::runtime_error(format("parse error: unexpected "
                                         "character '{:c}' at index {} of '{}'",
                                         c,
                                         i,
                                         s));
   }

   auto d = [&](unsigned ind) -> int {
      return (ind < s.size()) ? int(s[ind] - '0') : 0;
   };

   std::tm tm{};
   tm.tm_year = d(0) * 1000 + d(1) * 100 + d(2) * 10 + d(3) - 1900;
   tm.tm_mon  = d(5) * 10 + d(6) - 1;
   tm.tm_mday = d(8) * 10 + d(9);
   tm.tm_hour = d(11) * 10 + d(12);
   tm.tm_min  = d(14) * 10 + d(15);
   tm.tm_sec  = d(17) * 10 + d(18);
   const int micros = d(20) * 100000 + d(21) * 10000 + d(22) * 1000
                      + d(23) * 100 + d(24) * 10 + d(25);

   if(tm.tm_mon < 0 or tm.tm_mon > 11 or tm.tm_mday < 1 or tm.tm_mday > 31
      or tm.tm_hour > 23 or tm.tm_min > 59 or tm.tm_sec > 60)
      throw std::runtime_error(format("invalid date-time: '{}'", s));

   return Timestamp(int64_t(timegm(&tm)), micros);
}

// ------------------------------------------------------------------------- now
//
Timestamp This::now() noexcept
{
   return Timestamp(std::chrono::system_clock::now());
}

} // namespace anthro
