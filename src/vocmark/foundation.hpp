
#pragma once

#include "config.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "fmt/format.h"
#include "range/v3/all.hpp"

#include "utils/logger.hpp"
#include "utils/string-utils.hpp"

namespace views = ranges::views;

namespace vocmark
{
using fmt::format;

using std::array;
using std::string;
using std::string_view;
using std::vector;

using std::cout;
using std::endl;

using std::cbegin;
using std::cend;

using namespace std::string_literals;

template<class Key, class T> using hashmap = std::unordered_map<Key, T>;

// -- Contract checks. Failure is a programming error, and is FATAL.
#define Expects(cond)                                                \
   do {                                                              \
      if(!(cond)) FATAL(::fmt::format("precondition failed: {}", #cond));  \
   } while(false)

#define Ensures(cond)                                                \
   do {                                                              \
      if(!(cond)) FATAL(::fmt::format("postcondition failed: {}", #cond)); \
   } while(false)

} // namespace vocmark
