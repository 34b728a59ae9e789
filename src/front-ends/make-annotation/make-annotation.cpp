
#include "stdinc.hpp"
#include "make-annotation-inc.hpp"
#include "vocmark/annotation/box-arguments.hpp"
#include "vocmark/annotation/voc-codec.hpp"
#include "vocmark/utils/cli-utils.hpp"

namespace vocmark::make_annotation
{
// ---------------------------------------------------------------------- config
//
struct Config
{
   bool show_help          = false;
   bool has_error          = false;
   string image_file       = ""s;
   vector<string> labels   = {};
   vector<BoundingBox> boxes = {};
   string annotation_dir   = k_annotation_dir;
   bool allow_overwrite    = false;

   string to_string() const noexcept
   {
      return format(R"V0G0N(
   show-help:        {:s}
   has-error:        {:s}
   image-file:      '{:s}'
   labels:          ['{:s}']
   boxes:           [{:s}]
   annotation-dir:  '{:s}'
   allow-overwrite:  {:s}
)V0G0N",
                    str(show_help),
                    str(has_error),
                    image_file,
                    implode(cbegin(labels), cend(labels), "', '"),
                    implode(cbegin(boxes), cend(boxes), ", "),
                    annotation_dir,
                    str(allow_overwrite));
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
   cout << format(R"V0G0N(

   Usage: {:s} [OPTIONS...]

      -i <filename>            Input image. Required.
      -b <xmin,ymin,xmax,ymax> A bounding box. Repeat for more boxes.
      -l <label>               Object label. Give one per box, or a single
                               label for every box.
      -d <dirname>             Annotation directory, relative to the image's
                               folder unless absolute. Default is '{:s}'.
      -y                       Allow overwrite of the annotation file.

   Example:

      > {:s} -i frame-0001.jpg -b 548,472,878,753 -l "red roomba" \
            -b 697,293,982,531 -l "green roomba"

)V0G0N",
                  exec,
                  k_annotation_dir,
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
         if(arg == "-i"s) {
            config.image_file = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-l"s) {
            config.labels.push_back(cli::safe_arg_str(argc, argv, i));
         } else if(arg == "-b"s) {
            config.boxes.push_back(
                parse_box_argument(cli::safe_arg_str(argc, argv, i)));
         } else if(arg == "-d"s) {
            config.annotation_dir = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-y"s) {
            config.allow_overwrite = true;
         } else {
            cout << format("Unexpected argument: '{:s}'", arg) << endl;
            config.has_error = true;
         }
      } catch(std::exception& e) {
         cout << format("Error on command-line: {:s}", e.what()) << endl;
         config.has_error = true;
      }
   }
   if(config.has_error) return config;

   // -- Sanity checks
   if(config.image_file.empty()) {
      cout << format("Must specify an input image.\n");
      config.has_error = true;
   } else if(!is_regular_file(config.image_file)) {
      cout << format("Could not find input image '{:s}'.\n", config.image_file);
      config.has_error = true;
   }

   if(config.boxes.empty()) {
      cout << format("Must specify at least one bounding box.\n");
      config.has_error = true;
   }

   try {
      config.labels = labels_for_boxes(config.labels, config.boxes.size());
   } catch(std::invalid_argument& e) {
      cout << format("{:s}.\n", e.what());
      config.has_error = true;
   }

   if(config.annotation_dir.empty()) {
      cout << format("Annotation directory cannot be empty.\n");
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

   try {
      const auto fname = write_annotation_for_image_file(config.image_file,
                                                         config.labels,
                                                         config.boxes,
                                                         config.annotation_dir,
                                                         config.allow_overwrite);
      INFO(format("wrote {} objects to '{}'", config.boxes.size(), fname));
   } catch(AlreadyExistsError& e) {
      LOG_ERR(format("Cowardly refusing to overwrite: {}", e.what()));
      return EXIT_FAILURE;
   } catch(std::exception& e) {
      LOG_ERR(format("aborting: {}", e.what()));
      return EXIT_FAILURE;
   }

   return EXIT_SUCCESS;
}

} // namespace vocmark::make_annotation
