
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>

#include "stdinc.hpp"

#include "annotate/annotate-inc.hpp"
#include "make-annotation/make-annotation-inc.hpp"

using namespace vocmark;
using namespace std::string_literals;

// ------------------------------------------------------------------------ Runs

static auto make_runs()
{
   std::unordered_map<std::string, std::function<int(int, char**)>> r;
   std::unordered_map<std::string, std::function<std::string()>> b;

#define REGISTER(z, name)                 \
   {                                      \
      r[name] = vocmark::z ::run_main;    \
      b[name] = vocmark::z ::brief;       \
   }

   // -- register -- "main" functions
   REGISTER(annotate, "annotate");
   REGISTER(make_annotation, "make-annotation");

#undef REGISTER

   return make_pair(r, b);
}

// ------------------------------------------------------------------- show-help

static void show_help(const char* arg0)
{
   auto [runs, briefs] = make_runs();

   std::vector<std::string> names;
   for(const auto& ii : runs) names.push_back(ii.first);
   std::sort(names.begin(), names.end());

   auto f = [&](const string& s) {
      auto ii        = briefs.find(s);
      std::string bb = ""s;
      if(ii == cend(briefs)) {
         WARN(format("failed to find brief of '{:s}'", s));
      } else {
         bb = ii->second();
      }
      const int sz = 25 - int(s.size());
      std::string spaces(size_t(std::max(sz, 1)), ' ');

      return format("{:s}{:s}    {:s}", s, spaces, bb);
   };

   cout << format(R"V0G0N(

   Usage: {:s} [-h] <run> [OPTIONS...]

      Run can be one of:

      {:s}

   Type '{:s} <run> -h' for help on a run.

)V0G0N",
                  basename(arg0),
                  implode(names.begin(), names.end(), "\n      ", f),
                  basename(arg0));
}

// ------------------------------------------------------------------------ main

int main(int argc, char** argv)
{
   if(argc < 2) {
      cout << "Type -h for help" << endl;
      return EXIT_FAILURE;
   }

   const std::string arg = argv[1];
   if(arg == "--help"s || arg == "-h") {
      show_help(argv[0]);
      return EXIT_SUCCESS;
   }

   auto [runs, briefs] = make_runs();

   if(runs.find(arg) == runs.end()) {
      WARN(vocmark::format("Failed to find run '{:s}'", arg));
      return EXIT_FAILURE;
   }

   // Init environment variables
   vocmark::load_environment_variables();

   // Now "shift" argv[0] to argv[1]
   return runs.find(arg)->second(argc - 1, &argv[1]);
}
