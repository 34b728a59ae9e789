
#include "stdinc.hpp"

#include "logger.hpp"

#include <atomic>

namespace vocmark::logger
{
static std::atomic<int> log_level_{k_info};
static std::atomic<bool> colours_{true};

void set_level(int level) noexcept
{
   if(level < k_info or level > k_trace) {
      WARN(format("ignoring invalid log level {}", level));
      return;
   }
   log_level_ = level;
}

int level() noexcept { return log_level_; }

void enable_colours(bool value) noexcept { colours_ = value; }

// ------------------------------------------------------------------- level tag
//
static const char* level_tag(int level) noexcept
{
   const bool c = colours_;
   switch(level) {
   case k_info: return c ? "\x1b[34mINFO \x1b[0m" : "INFO ";
   case k_warn: return c ? "\x1b[33mWARN \x1b[0m" : "WARN ";
   case k_error: return c ? "\x1b[31mERROR\x1b[0m" : "ERROR";
   case k_fatal: return c ? "\x1b[31mFATAL\x1b[0m" : "FATAL";
   case k_trace: return c ? "\x1b[42m\x1b[97mTRACE\x1b[0m" : "TRACE";
   }
   return "?    ";
}

// ---------------------------------------------------------------------- report
//
void report(int level, const char* file, int lineno, const string& msg) noexcept
{
   static std::mutex padlock;

   const auto where = colours_ ? format("\x1b[37m{}:{}\x1b[0m", file, lineno)
                               : format("{}:{}", file, lineno);

   std::ostream& out
       = (level >= k_warn and level <= k_fatal) ? std::cerr : std::cout;
   {
      std::lock_guard<decltype(padlock)> lock(padlock);
      out << level_tag(level) << ' ' << where << ' ' << msg << '\n';
      out.flush();
   }

   if(level == k_fatal) exit(EXIT_FAILURE);
}

} // namespace vocmark::logger
