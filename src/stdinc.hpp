
#ifndef VOCMARK_STDINC_HPP
#define VOCMARK_STDINC_HPP

// Keep this small
#include "vocmark/foundation.hpp"

#ifdef __cplusplus

#include "vocmark/utils/file-system.hpp"
#include "vocmark/utils/string-utils.hpp"

#include <string_view>

#endif

#endif
