
#pragma once

#include "string-utils.hpp"
#include "vocmark/config.hpp"

#include <string>

// Every macro takes anything `str()` accepts.
#define VOCMARK_LOG_AT_(level, m)                                 \
   do {                                                           \
      if(::vocmark::logger::is_enabled(level))                    \
         ::vocmark::logger::report(                               \
             level, __FILE__, __LINE__, ::vocmark::str(m));       \
   } while(false)

#define INFO(m) VOCMARK_LOG_AT_(::vocmark::logger::k_info, m)
#define WARN(m) VOCMARK_LOG_AT_(::vocmark::logger::k_warn, m)
#define LOG_ERR(m) VOCMARK_LOG_AT_(::vocmark::logger::k_error, m)

// Logs, then exits the process.
#define FATAL(m) \
   ::vocmark::logger::report(   \
       ::vocmark::logger::k_fatal, __FILE__, __LINE__, ::vocmark::str(m))

// Only when VOCMARK_TRACE_MODE is set.
#define TRACE(m)                                             \
   do {                                                      \
      if(::vocmark::vocmark_trace_mode())                    \
         ::vocmark::logger::report(::vocmark::logger::k_trace, \
                                   __FILE__,                 \
                                   __LINE__,                 \
                                   ::vocmark::str(m));       \
   } while(false)

namespace vocmark::logger
{
constexpr int k_info  = 1;
constexpr int k_warn  = 2;
constexpr int k_error = 3;
constexpr int k_fatal = 4;
constexpr int k_trace = 5;

// Messages below `level` are dropped. FATAL and TRACE ignore it.
void set_level(int level) noexcept;
int level() noexcept;
inline bool is_enabled(int lvl) noexcept { return lvl >= level(); }

void enable_colours(bool value) noexcept;

// Thread safe. Levels WARN to FATAL go to stderr, the rest to stdout.
void report(int level,
            const char* file,
            int lineno,
            const std::string& msg) noexcept;

} // namespace vocmark::logger
