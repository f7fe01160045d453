
#pragma once

#include <algorithm>
#include <cctype>
#include <cfloat>
#include <cstdio>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace anthro
{
using std::string;
using std::string_view;

// -- Terminal Colours

#define ANSI_COLOUR_RED "\x1b[31m"
#define ANSI_COLOUR_GREEN "\x1b[32m"
#define ANSI_COLOUR_YELLOW "\x1b[33m"
#define ANSI_COLOUR_BLUE "\x1b[34m"
#define ANSI_COLOUR_MAGENTA "\x1b[35m"
#define ANSI_COLOUR_CYAN "\x1b[36m"
#define ANSI_COLOUR_GREY "\x1b[37m"
#define ANSI_COLOUR_WHITE "\x1b[97m"

#define ANSI_DIM "\x1b[2m"
#define ANSI_UNDERLINE "\x1b[4m"

#define ANSI_COLOUR_RESET "\x1b[0m"

// -------------------------------------------------------------------- str shim

namespace detail
{
   template<typename T> string format_(const char* fmt, const T& v)
   {
      constexpr int k_size = 32;
      char buffer[k_size];
      int written = snprintf(buffer, k_size, fmt, v);
      if(written < k_size - 1) return string(buffer);
      std::unique_ptr<char[]> b2(new char[size_t(written + 1)]);
      snprintf(b2.get(), size_t(written + 1), fmt, v);
      return string(b2.get());
   }

} // namespace detail

// strings
inline string& str(string& s) { return s; }
inline const string& str(const string& s) { return s; }
inline string str(const string_view s) { return string(s); }

// Basic types
inline string str(bool v) { return v ? "true" : "false"; }
inline string str(char c) { return string(1, c); }
inline string str(int v) { return detail::format_<int>("%d", v); }
inline string str(unsigned int v)
{
   return detail::format_<unsigned int>("%u", v);
}
inline string str(long int v) { return detail::format_<long int>("%ld", v); }
inline string str(unsigned long int v)
{
   return detail::format_<unsigned long int>("%lu", v);
}
inline string str(float v)
{
   return detail::format_<double>("%f", static_cast<double>(v));
}
inline string str(double v) { return detail::format_<double>("%f", v); }
inline string str(const char* p) { return string(p); }

// ---------------------------------------------------------------------- Indent

inline std::string indent(const string& s, int level)
{
   const std::string indent_s(size_t(level), char(' '));
   std::stringstream ss{""};
   std::istringstream input{s};
   for(string line; std::getline(input, line);)
      ss << indent_s << line << std::endl;
   string ret = ss.str();
   if(s.size() > 0 && s[0] != '\n') ret.pop_back();
   return ret;
}

// --------------------------------------------------------------------- Implode

template<typename InputIt, typename F>
string implode(InputIt first, InputIt last, const std::string_view glue, F f)
{
   std::stringstream stream("");
   bool start = true;
   while(first != last) {
      if(start)
         start = false;
      else
         stream << glue;
      stream << str(f(*first++));
   }
   return stream.str();
}

template<typename InputIt>
string implode(InputIt first, InputIt last, const std::string_view glue)
{
   auto f = [](const decltype(*first)& v) -> std::string { return str(v); };
   return implode(first, last, glue, f);
}

std::vector<std::string> explode(const std::string_view line,
                                 const std::string_view delims,
                                 const bool collapse_empty_fields
                                 = false) noexcept(false); // std::bad_alloc

// ----------------------------------------------------------------- Begins with

template<class U, class V>
constexpr bool begins_with(const U& input, const V& match)
{
   return input.size() >= match.size()
          and std::equal(cbegin(match), cend(match), begin(input));
}

template<class U, class V>
constexpr bool ends_with(const U& input, const V& match)
{
   return input.size() >= match.size()
          and std::equal(crbegin(match), crend(match), rbegin(input));
}

// ------------------------------------------------------------------------ Trim

inline void ltrim(std::string& s)
{
   s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) {
              return !std::isspace(ch);
           }));
}

inline void rtrim(std::string& s)
{
   s.erase(std::find_if(
               s.rbegin(), s.rend(), [](int ch) { return !std::isspace(ch); })
               .base(),
           s.end());
}

inline void trim(std::string& s)
{
   ltrim(s);
   rtrim(s);
}

inline string trim_copy(const std::string& s)
{
   auto ret = s;
   trim(ret);
   return ret;
}

// Lower-case, spaces and dashes become underscores: "Left Shoulder" =>
// "left_shoulder"
string to_snake_case(const std::string_view s) noexcept;

// --------------------------------------------------------- synchronized output

inline void sync_write(std::function<void()> thunk)
{
   static std::mutex padlock;
   std::lock_guard<decltype(padlock)> lock(padlock);
   thunk();
}

inline void sync_write(std::ostream& os, const std::string& s)
{
   sync_write([&]() {
      os << s;
      os.flush();
   });
}

} // namespace anthro
