
#include "config.hpp"

#include "stdinc.hpp"

#include "json/json.h"

#include <boost/lexical_cast.hpp>

namespace vocmark
{
static constexpr const char* k_trace_mode_var = "VOCMARK_TRACE_MODE";
static constexpr const char* k_log_level_var  = "VOCMARK_LOG_LEVEL";
static constexpr const char* k_no_colours_var = "VOCMARK_NO_COLOURS";

namespace
{
   struct Environment
   {
      bool is_loaded = false;
      bool trace_mode = false;
      Json::Value settings{Json::objectValue}; // variable name => value
   };

   Environment& environment()
   {
      static Environment env;
      return env;
   }

   const Environment& loaded_environment()
   {
      const auto& env = environment();
      if(!env.is_loaded)
         FATAL("'load_environment_variables()' must be called first");
      return env;
   }

   string getenv_or_empty(const char* name)
   {
      const char* s = std::getenv(name);
      return (s == nullptr) ? ""s : string(s);
   }

   bool parse_flag(const string& s)
   {
      const auto v = string_to_lowercase(trim_copy(s));
      return v == "1" or v == "true" or v == "yes";
   }

   int parse_log_level(const string& s)
   {
      if(trim_copy(s).empty()) return logger::k_info;
      try {
         return boost::lexical_cast<int>(trim_copy(s));
      } catch(boost::bad_lexical_cast&) {
         FATAL(format("{}='{}' is not an integer", k_log_level_var, s));
      }
      return logger::k_info;
   }
} // namespace

// -------------------------------------------------- load-environment-variables
//
void load_environment_variables() noexcept
{
   static std::once_flag once;
   std::call_once(once, []() {
      auto& env = environment();

      auto& o             = env.settings;
      o[k_trace_mode_var] = parse_flag(getenv_or_empty(k_trace_mode_var));
      o[k_no_colours_var] = parse_flag(getenv_or_empty(k_no_colours_var));
      o[k_log_level_var]  = parse_log_level(getenv_or_empty(k_log_level_var));

      env.trace_mode = o[k_trace_mode_var].asBool();
      logger::set_level(o[k_log_level_var].asInt());
      logger::enable_colours(!o[k_no_colours_var].asBool());

      env.is_loaded = true;
   });
}

bool vocmark_trace_mode() noexcept { return loaded_environment().trace_mode; }

// ------------------------------------------------------------ environment-info
//
string environment_info() noexcept
{
   const auto& settings = loaded_environment().settings;

   std::stringstream ss{""};
   ss << format("   {:<24} = '{}'\n", "vocmark-version", k_version);
   ss << format("   {:<24} = {}{}\n",
                "build",
                k_is_testcase_build ? "testcases" : "cli",
                k_is_debug_build ? ", debug" : "");
   for(const auto& name : settings.getMemberNames())
      ss << format("   {:<24} = {}\n", name, settings[name].asString());
   return ss.str();
}

} // namespace vocmark
