
#pragma once

#include <cmath>
#include <string>

#include "anthro/foundation.hpp"

namespace anthro
{
// --------------------------------------------------------------------- Vector2

template<typename T> class Vector2T
{
 public:
   using value_type = T;

   T x, y;

   constexpr Vector2T()
       : x(T(0.0))
       , y(T(0.0))
   {}
   constexpr Vector2T(T x_, T y_)
       : x(x_)
       , y(y_)
   {}

   static constexpr Vector2T nan() { return Vector2T(T(NAN), T(NAN)); }

   unsigned size() const noexcept { return 2; }
   T* ptr() noexcept { return &x; }
   const T* ptr() const noexcept { return &x; }

   T quadrance() const noexcept { return x * x + y * y; }
   T norm() const noexcept { return std::sqrt(quadrance()); }
   T dot(const Vector2T& o) const noexcept { return x * o.x + y * o.y; }
   T distance(const Vector2T& o) const noexcept { return (*this - o).norm(); }

   bool is_finite() const noexcept
   {
      return std::isfinite(x) and std::isfinite(y);
   }

   bool operator==(const Vector2T& o) const noexcept
   {
      return x == o.x and y == o.y;
   }
   bool operator!=(const Vector2T& o) const noexcept { return !(*this == o); }

   Vector2T operator+(const Vector2T& o) const noexcept
   {
      return Vector2T(x + o.x, y + o.y);
   }
   Vector2T operator-(const Vector2T& o) const noexcept
   {
      return Vector2T(x - o.x, y - o.y);
   }
   Vector2T operator*(T s) const noexcept { return Vector2T(x * s, y * s); }

   std::string to_string() const { return format("[{}, {}]", x, y); }
   friend std::string str(const Vector2T& o) { return o.to_string(); }
};

// --------------------------------------------------------------------- Vector3

template<typename T> class Vector3T
{
 public:
   using value_type = T;

   T x, y, z;

   constexpr Vector3T()
       : x(T(0.0))
       , y(T(0.0))
       , z(T(0.0))
   {}
   constexpr Vector3T(T x_, T y_, T z_)
       : x(x_)
       , y(y_)
       , z(z_)
   {}
   constexpr Vector3T(const Vector2T<T>& p, T z_)
       : x(p.x)
       , y(p.y)
       , z(z_)
   {}

   static constexpr Vector3T nan() { return Vector3T(T(NAN), T(NAN), T(NAN)); }

   unsigned size() const noexcept { return 3; }
   T* ptr() noexcept { return &x; }
   const T* ptr() const noexcept { return &x; }

   Vector2T<T> xy() const noexcept { return Vector2T<T>(x, y); }

   T quadrance() const noexcept { return x * x + y * y + z * z; }
   T norm() const noexcept { return std::sqrt(quadrance()); }
   T distance(const Vector3T& o) const noexcept { return (*this - o).norm(); }

   bool is_finite() const noexcept
   {
      return std::isfinite(x) and std::isfinite(y) and std::isfinite(z);
   }

   bool operator==(const Vector3T& o) const noexcept
   {
      return x == o.x and y == o.y and z == o.z;
   }
   bool operator!=(const Vector3T& o) const noexcept { return !(*this == o); }

   Vector3T operator+(const Vector3T& o) const noexcept
   {
      return Vector3T(x + o.x, y + o.y, z + o.z);
   }
   Vector3T operator-(const Vector3T& o) const noexcept
   {
      return Vector3T(x - o.x, y - o.y, z - o.z);
   }
   Vector3T operator*(T s) const noexcept
   {
      return Vector3T(x * s, y * s, z * s);
   }

   std::string to_string() const { return format("[{}, {}, {}]", x, y, z); }
   friend std::string str(const Vector3T& o) { return o.to_string(); }
};

using Vector2 = Vector2T<real>;
using Vector3 = Vector3T<real>;

} // namespace anthro
