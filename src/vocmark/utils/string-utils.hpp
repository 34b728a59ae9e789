
#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "fmt/format.h"

namespace vocmark
{
using std::string;
using std::string_view;

// -------------------------------------------------------------------- str shim
// `str(x)` turns loggable things into strings. Domain types supply a friend
// `str` found by ADL.

inline const string& str(const string& s) noexcept { return s; }
inline string str(const string_view s) { return string(s); }
inline string str(const char* s) { return string(s); }
inline string str(bool v) { return v ? "true" : "false"; }
inline string str(char c) { return string(1, c); }

template<typename T>
inline std::enable_if_t<std::is_arithmetic_v<T>, string> str(T v)
{
   return fmt::format("{}", v);
}

// --------------------------------------------------------------------- implode

template<typename InputIt, typename F>
string implode(InputIt first, InputIt last, const string_view glue, F f)
{
   string out;
   for(auto ii = first; ii != last; ++ii) {
      if(ii != first) out.append(glue);
      out.append(str(f(*ii)));
   }
   return out;
}

template<typename InputIt>
string implode(InputIt first, InputIt last, const string_view glue)
{
   return implode(first, last, glue, [](const auto& v) { return str(v); });
}

// --------------------------------------------------------------------- explode
// Splits on any character in `delims`. "a,,b" gives {"a", "", "b"} unless
// `skip_empty` is set.
std::vector<string> explode(const string_view line,
                            const string_view delims,
                            const bool skip_empty = false) noexcept(false);

// ------------------------------------------------------------------------ trim

string trim_copy(const string_view s) noexcept(false);

// ------------------------------------------------------------- case-conversion

string string_to_lowercase(const string_view s) noexcept(false);

} // namespace vocmark
