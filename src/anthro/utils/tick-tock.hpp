
#pragma once

#include <chrono>
#include <cmath>
#include <functional>

namespace anthro
{
inline std::chrono::time_point<std::chrono::steady_clock> tick() noexcept
{
   return std::chrono::steady_clock::now();
}

inline double
tock(const std::chrono::time_point<std::chrono::steady_clock>& whence) noexcept
{
   using ss = std::chrono::duration<double, std::ratio<1, 1>>;
   return std::chrono::duration_cast<ss>(tick() - whence).count();
}

inline double ms_tock_f(
    const std::chrono::time_point<std::chrono::steady_clock>& whence) noexcept
{
   return std::round(tock(whence) * 1000000.0) * 0.001;
}

inline double time_thunk(std::function<void(void)> f)
{
   auto now = tick();
   f();
   return tock(now);
}

} // namespace anthro
