
#include "stdinc.hpp"

#include "string-utils.hpp"

#include <cctype>

namespace vocmark
{
static constexpr const char* k_whitespace = " \t\n\r\f\v";

// --------------------------------------------------------------------- explode
//
vector<string> explode(const string_view line,
                       const string_view delims,
                       const bool skip_empty) noexcept(false)
{
   vector<string> fields;
   if(line.empty()) return fields;

   size_t pos0 = 0;
   while(true) {
      const auto pos1  = line.find_first_of(delims, pos0);
      const auto field = line.substr(pos0, pos1 - pos0);
      if(!skip_empty or !field.empty()) fields.emplace_back(field);
      if(pos1 == string_view::npos) break;
      pos0 = pos1 + 1;
   }

   return fields;
}

// ------------------------------------------------------------------------ trim
//
string trim_copy(const string_view s) noexcept(false)
{
   const auto pos0 = s.find_first_not_of(k_whitespace);
   if(pos0 == string_view::npos) return ""s;
   const auto pos1 = s.find_last_not_of(k_whitespace);
   return string(s.substr(pos0, pos1 - pos0 + 1));
}

// ------------------------------------------------------------- case-conversion
//
string string_to_lowercase(const string_view s) noexcept(false)
{
   string o(s);
   for(auto& c : o) c = char(std::tolower(static_cast<unsigned char>(c)));
   return o;
}

} // namespace vocmark
