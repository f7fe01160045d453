
#pragma once

#include "anthro/foundation.hpp"

namespace anthro::cli
{
inline string safe_arg_str(int argc, char** argv, int& i) noexcept(false)
{
   auto arg = argv[i];
   ++i;
   if(i >= argc) {
      auto msg = format("expected string after argument '{}'", arg);
      throw std::runtime_error(msg);
   }
   return string(argv[i]);
}

inline real safe_arg_real(int argc, char** argv, int& i) noexcept(false)
{
   auto arg = argv[i];
   ++i;
   auto badness = (i >= argc);
   auto ret     = 0.0;

   if(!badness) {
      char* end = nullptr;
      ret       = strtod(argv[i], &end);
      if(*end != '\0') badness = true;
   }

   if(badness) {
      auto msg = format("expected numeric after argument '{}'", arg);
      throw std::runtime_error(msg);
   }

   return ret;
}

} // namespace anthro::cli
