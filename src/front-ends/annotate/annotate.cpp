
#include "stdinc.hpp"
#include "annotate-inc.hpp"
#include "vocmark/annotation/annotator-loop.hpp"
#include "vocmark/annotation/cv-window.hpp"
#include "vocmark/utils/cli-utils.hpp"

namespace vocmark::annotate
{
// ---------------------------------------------------------------------- config
//
struct Config
{
   bool show_help     = false;
   bool has_error     = false;
   string folder      = ""s;
   string label       = ""s;
   string image_ext   = k_default_image_extension;
   string window_name = k_default_window_name;
   int poll_ms        = k_default_poll_ms;

   string to_string() const noexcept
   {
      return format(R"V0G0N(
   show-help:        {:s}
   has-error:        {:s}
   folder:          '{:s}'
   label:           '{:s}'
   image-ext:       '{:s}'
   window-name:     '{:s}'
   poll-ms:          {}
)V0G0N",
                    str(show_help),
                    str(has_error),
                    folder,
                    label,
                    image_ext,
                    window_name,
                    poll_ms);
   }

   friend string str(const Config& config) noexcept
   {
      return config.to_string();
   }
};

// ------------------------------------------------------------------- Show Help
//
static void show_help(string arg0)
{
   auto exec = basename(arg0);
   const KeyBindings keys;
   cout << format(R"V0G0N(

   Usage: {:s} [OPTIONS...]

      -f, --folder <dirname>   Folder of images to annotate. Required.
      -l, --label <string>     Object class label given to every box. Required.
      -e, --ext <extension>    Image file extension. Default is '{:s}'.
      -w, --window-name <name> Window title.
      --poll-ms <integer>      Input poll wait, in milliseconds. Default is {}.

   Annotations are written to <dirname>/{:s}/<image-stem>{:s}

   Mouse:

      Left-drag                Draw a box.

   Keys:

      {:c}                        Next image.
      {:c}                        Previous image.
      {:c}                        Undo the last box.
      {:c}                        Clear all boxes on this image.
      {:c}, ESC                   Save and quit.

   Example:

      > {:s} -f ~/data/roomba-frames -l "red roomba"

)V0G0N",
                  exec,
                  k_default_image_extension,
                  k_default_poll_ms,
                  k_annotation_dir,
                  k_annotation_extension,
                  keys.next,
                  keys.previous,
                  keys.undo,
                  keys.clear,
                  keys.quit,
                  exec);
}

// ---------------------------------------------------------- parse command line
//
static Config parse_command_line(int argc, char** argv)
{
   Config config;

   // -- Look for -h/--help
   for(int i{1}; i < argc; ++i)
      if(strcmp(argv[i], "-h") == 0 or strcmp(argv[i], "--help") == 0)
         config.show_help = true;
   if(config.show_help) return config;

   for(int i{1}; i < argc; ++i) {
      string arg = argv[i];
      try {
         if(arg == "-f"s or arg == "--folder"s) {
            config.folder = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-l"s or arg == "--label"s) {
            config.label = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-e"s or arg == "--ext"s) {
            config.image_ext = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-w"s or arg == "--window-name"s) {
            config.window_name = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "--poll-ms"s) {
            config.poll_ms = cli::safe_arg_int(argc, argv, i);
         } else {
            cout << format("Unexpected argument: '{:s}'", arg) << endl;
            config.has_error = true;
         }
      } catch(std::runtime_error& e) {
         cout << format("Error on command-line: {:s}", e.what()) << endl;
         config.has_error = true;
      }
   }
   if(config.has_error) return config;

   // -- Sanity checks
   if(config.folder.empty()) {
      cout << format("Must specify an image folder.\n");
      config.has_error = true;
   } else if(!is_directory(config.folder)) {
      cout << format("Could not find image folder '{:s}'.\n", config.folder);
      config.has_error = true;
   }

   if(config.label.empty()) {
      cout << format("Must specify an object label.\n");
      config.has_error = true;
   }

   if(config.image_ext.empty() or config.image_ext[0] != '.')
      config.image_ext = format(".{}", config.image_ext);

   if(config.poll_ms < 1) {
      cout << format("Poll wait must be at least 1ms, got {}.\n", config.poll_ms);
      config.has_error = true;
   }

   return config;
}

// -------------------------------------------------------------------- Run Main
//
int run_main(int argc, char** argv)
{
   const auto config = parse_command_line(argc, argv);
   if(config.show_help) {
      show_help(argv[0]);
      return EXIT_SUCCESS;
   }
   if(config.has_error) {
      INFO("printing configuration before aborting:");
      cout << str(config) << endl;
      return EXIT_FAILURE;
   }

   TRACE(format("{}{}", environment_info(), config.to_string()));

   try {
      AnnotatorSession session(config.folder, config.label, config.image_ext);
      CvWindow window(config.window_name);
      const auto ticks = run_annotator(session, window, config.poll_ms);
      TRACE(format("annotator ran for {} ticks", ticks));
   } catch(AnnotationError& e) {
      LOG_ERR(e.what());
      return EXIT_FAILURE;
   } catch(std::exception& e) {
      LOG_ERR(format("aborting: {}", e.what()));
      return EXIT_FAILURE;
   }

   return EXIT_SUCCESS;
}

} // namespace vocmark::annotate
