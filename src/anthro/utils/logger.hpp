
#pragma once

#include "fmt/format.h"
#include "string-utils.hpp"
#include <cassert>
#include <iostream>
#include <mutex>

#ifdef DEBUG_BUILD
#define DLOG(m) \
   ::anthro::Logger::report(0, __FILE__, __LINE__, ::anthro::str(m))
#else
#define DLOG(m)
#endif

#define INFO(m)                       \
   if(::anthro::get_log_level() <= 1) \
   ::anthro::Logger::report(1, __FILE__, __LINE__, ::anthro::str(m))
#define WARN(m)                       \
   if(::anthro::get_log_level() <= 2) \
   ::anthro::Logger::report(2, __FILE__, __LINE__, ::anthro::str(m))
#define LOG_ERR(m)                    \
   if(::anthro::get_log_level() <= 3) \
   ::anthro::Logger::report(3, __FILE__, __LINE__, ::anthro::str(m))
#define FATAL(m) \
   ::anthro::Logger::report(4, __FILE__, __LINE__, ::anthro::str(m))
#define TRACE(m)                      \
   if(::anthro::anthro_trace_mode())  \
   ::anthro::Logger::report(5, __FILE__, __LINE__, ::anthro::str(m))

namespace anthro
{
using fmt::format;
using std::string;

inline void logger_enable_colours(bool value);
inline bool logger_colours_enabled();

inline int get_log_level();
inline void set_log_info();  // 1
inline void set_log_warn();  // 2
inline void set_log_error(); // 3
// Fatal is always logged

class Logger;

} // namespace anthro

// -------------------------------------------------------------- Implementation

namespace anthro
{
class Logger
{
 private:
   static Logger* instance()
   {
      static Logger instance_;
      return &instance_;
   }

   static const char* level_to_string(int level)
   {
      if(colours_enabled()) {
         switch(level) {
         case 0: return ANSI_COLOUR_CYAN "DEBUG" ANSI_COLOUR_RESET;
         case 1: return ANSI_COLOUR_BLUE "INFO " ANSI_COLOUR_RESET;
         case 2: return ANSI_COLOUR_YELLOW "WARN " ANSI_COLOUR_RESET;
         case 3: return ANSI_COLOUR_RED "ERROR" ANSI_COLOUR_RESET;
         case 4: return ANSI_COLOUR_RED "FATAL" ANSI_COLOUR_RESET;
         case 5:
            return "\x1b[42m\x1b[97m"
                   "TRACE" ANSI_COLOUR_RESET;
         default: assert(false); break;
         }
      } else {
         switch(level) {
         case 0: return "DEBUG";
         case 1: return "INFO ";
         case 2: return "WARN ";
         case 3: return "ERROR";
         case 4: return "FATAL";
         case 5: return "TRACE";
         default: assert(false); break;
         }
      }
      return "?";
   }

   bool colours_   = true;
   int log_level_  = 0;

   Logger()  = default;
   ~Logger() = default;

 public:
   static void
   report(int level, const char* file, int lineno, const string& msg)
   {
      if((level >= log_level() && level <= 5) || level == 0) {
         std::ostream& out = (level >= 2 and level <= 4) ? std::cerr : std::cout;
         sync_write([&]() {
            out << level_to_string(level) << " " << ANSI_COLOUR_GREY << file
                << ":" << lineno << ANSI_COLOUR_RESET << " " << msg << "\n";
         });
         if(level == 4) {
            out.flush();
            exit(1); // Die on fatal
         }
      }
   }

   static int log_level() { return instance()->log_level_; }

   static void set_log_level(int level)
   {
      if(level > 0 && level <= 5)
         instance()->log_level_ = level;
      else
         report(
             2, __FILE__, __LINE__, format("Invalid log level: {}", level));
   }

   static bool colours_enabled() { return instance()->colours_; }

   static void enable_colours(bool value) { instance()->colours_ = value; }
};

} // namespace anthro

inline int ::anthro::get_log_level() { return ::anthro::Logger::log_level(); }
inline void ::anthro::set_log_info() { ::anthro::Logger::set_log_level(1); }
inline void ::anthro::set_log_warn() { ::anthro::Logger::set_log_level(2); }
inline void ::anthro::set_log_error() { ::anthro::Logger::set_log_level(3); }

inline void ::anthro::logger_enable_colours(bool value)
{
   ::anthro::Logger::enable_colours(value);
}
inline bool ::anthro::logger_colours_enabled()
{
   return ::anthro::Logger::colours_enabled();
}
