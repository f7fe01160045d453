
#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>

namespace anthro
{
// UTC, microsecond resolution. Serializes as "YYYY-MM-DDTHH:MM:SS.uuuuuu".
struct Timestamp
{
 public:
   using system_clock_time_point = std::chrono::system_clock::time_point;

 private:
   static constexpr int64_t M = 1000000;
   int64_t x{0}; // micros since epoch

 public:
   Timestamp() = default;
   explicit Timestamp(int64_t seconds, int micros = 0) noexcept
       : x(seconds * M + micros)
   {}
   Timestamp(const system_clock_time_point& when) noexcept { set(when); }
   Timestamp(const Timestamp&) = default;
   Timestamp(Timestamp&&)      = default;
   ~Timestamp()                = default;
   Timestamp& operator=(const Timestamp&) = default;
   Timestamp& operator=(Timestamp&&) = default;

   static Timestamp parse(const std::string_view s) noexcept(false);
   static Timestamp now() noexcept;

   int64_t raw() const noexcept { return x; }
   bool empty() const noexcept { return x == 0; }

   bool operator==(const Timestamp& o) const noexcept { return x == o.x; }
   bool operator!=(const Timestamp& o) const noexcept { return x != o.x; }
   bool operator<(const Timestamp& o) const noexcept { return x < o.x; }
   bool operator<=(const Timestamp& o) const noexcept { return x <= o.x; }
   bool operator>(const Timestamp& o) const noexcept { return x > o.x; }
   bool operator>=(const Timestamp& o) const noexcept { return x >= o.x; }

   Timestamp& add_micros(int64_t v) noexcept
   {
      x += v;
      return *this;
   }
   Timestamp& add_millis(int64_t v) noexcept { return add_micros(v * 1000); }

   int64_t micros_to(const Timestamp& v) const noexcept { return v.x - x; }

   uint32_t micros() const noexcept { return uint32_t(((x % M) + M) % M); }
   int64_t seconds_from_epoch() const noexcept
   {
      return (x - int64_t(micros())) / M;
   }

   void set(const system_clock_time_point& when) noexcept;

   std::string to_string() const noexcept;
   friend std::string str(const Timestamp& t) noexcept { return t.to_string(); }
};

} // namespace anthro
