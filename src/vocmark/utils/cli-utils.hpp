
#pragma once

#include "vocmark/foundation.hpp"

#include <boost/lexical_cast.hpp>

namespace vocmark::cli
{
// The value following the switch at `argv[i]`. Advances `i` past it.
inline string safe_arg_str(int argc, char** argv, int& i) noexcept(false)
{
   const string sw = argv[i];
   if(++i >= argc)
      throw std::runtime_error(format("expected a value after '{}'", sw));
   return argv[i];
}

inline int safe_arg_int(int argc, char** argv, int& i) noexcept(false)
{
   const string sw  = argv[i];
   const string val = safe_arg_str(argc, argv, i);
   try {
      return boost::lexical_cast<int>(val);
   } catch(boost::bad_lexical_cast&) {
      throw std::runtime_error(
          format("expected an integer after '{}', but got '{}'", sw, val));
   }
}

} // namespace vocmark::cli
