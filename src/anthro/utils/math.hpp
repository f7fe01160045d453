
#pragma once

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>

#include "string-utils.hpp"

namespace anthro
{
constexpr float fNAN  = std::numeric_limits<float>::quiet_NaN();
constexpr double dNAN = std::numeric_limits<double>::quiet_NaN();

template<typename T> constexpr T square(T x) noexcept { return x * x; }

// ----------------------------------------------------------- Inclusive Between

template<typename T, class less_eq = std::less_equal<T>>
inline constexpr bool inclusive_between(const T low_bound,
                                        const T value,
                                        const T high_bound,
                                        less_eq leq = std::less_equal<T>{})
{
   return leq(value, high_bound) && leq(low_bound, value);
}

// -------------------------------------------------------------------- Float-Eq

namespace detail
{
   template<typename T> inline T default_is_close_epsilon() noexcept
   {
      if constexpr(sizeof(T) == 4)
         return 1e-4f;
      else
         return 1e-6;
   }
} // namespace detail

template<typename T>
inline T relative_epsilon(T a, T b, T relative_tolerance = T(NAN)) noexcept
{
   if(std::isnan(relative_tolerance))
      relative_tolerance = detail::default_is_close_epsilon<T>();
   return relative_tolerance * T(std::max(std::fabs(a), std::fabs(b)));
}

template<typename T>
inline bool is_close(T a, T b, T relative_tolerance = T(NAN)) noexcept
{
   return std::isfinite(a) and std::isfinite(b)
          and T(std::fabs(a - b)) <= relative_epsilon(a, b, relative_tolerance);
}

// ----------------------------------------------------------- relative-spread
// (max - min) / min of a set of positive values. Zero for a single value.
template<typename InputIt>
inline double relative_spread(InputIt first, InputIt last) noexcept
{
   if(first == last) return 0.0;
   const auto [lo, hi] = std::minmax_element(first, last);
   if(!(*lo > 0.0)) return std::numeric_limits<double>::infinity();
   return (*hi - *lo) / *lo;
}

// ------------------------------------------------------ Ramanujan's perimeter
// Perimeter of an ellipse with semi-axes 'a' and 'b'. Ramanujan's first
// approximation. Exact for circles.
inline double ellipse_perimeter(double a, double b) noexcept
{
   return M_PI * (3.0 * (a + b) - std::sqrt((3.0 * a + b) * (a + 3.0 * b)));
}

} // namespace anthro
