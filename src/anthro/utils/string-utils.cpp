
#include "stdinc.hpp"

#include "string-utils.hpp"

namespace anthro
{
// --------------------------------------------------------------------- explode

vector<string> explode(const std::string_view line,
                       const std::string_view delims,
                       const bool collapse_empty_fields) noexcept(false)
{
   vector<string> o;

   if(line.empty()) return o;

   auto push_it = [&](const auto pos0, const auto pos1) {
      const auto sz = (pos1 == string::npos)
                          ? (string::size_type(line.size()) - pos0)
                          : (pos1 - pos0);
      const auto s  = line.substr(pos0, sz);
      if(!s.empty() or !collapse_empty_fields)
         o.push_back(string(cbegin(s), cend(s)));

      return (pos1 == string::npos) ? string::npos : pos1 + 1;
   };

   string::size_type pos = 0;
   while(pos != string::npos) {
      const auto new_pos = line.find_first_of(delims, pos);
      pos                = push_it(pos, new_pos);
   }

   return o;
}

// --------------------------------------------------------------- to-snake-case

string to_snake_case(const std::string_view s) noexcept
{
   string out;
   out.reserve(s.size());
   for(const char c : s) {
      if(c == ' ' or c == '-')
         out.push_back('_');
      else
         out.push_back(char(std::tolower(static_cast<unsigned char>(c))));
   }
   return out;
}

} // namespace anthro
