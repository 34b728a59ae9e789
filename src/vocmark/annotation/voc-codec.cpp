
#include "stdinc.hpp"

#include "voc-codec.hpp"

#include <filesystem>

#include <boost/property_tree/xml_parser.hpp>
#include <opencv2/imgcodecs/imgcodecs.hpp>

namespace vocmark
{
namespace pt = boost::property_tree;

static constexpr const char* k_root_name   = "annotation";
static constexpr const char* k_object_name = "object";

// ---------------------------------------------------------------------- encode
//
VocDocument encode(const ImageDimensions& dims,
                   const vector<string>& labels,
                   const vector<BoundingBox>& boxes) noexcept(false)
{
   if(labels.size() != boxes.size())
      throw std::invalid_argument(
          format("label and bounding box collection sizes are mismatched: "
                 "{} labels, {} boxes",
                 labels.size(),
                 boxes.size()));

   VocDocument root;
   root.put("size.width", dims.width);
   root.put("size.height", dims.height);
   root.put("size.depth", dims.depth);

   for(size_t i = 0; i < boxes.size(); ++i) {
      const auto& bb = boxes[i];
      VocDocument obj;
      obj.put("name", labels[i]);
      obj.put("truncated", 0);
      obj.put("difficult", 0);
      obj.put("bndbox.xmin", bb.xmin);
      obj.put("bndbox.ymin", bb.ymin);
      obj.put("bndbox.xmax", bb.xmax);
      obj.put("bndbox.ymax", bb.ymax);
      root.add_child(k_object_name, obj);
   }

   VocDocument doc;
   doc.add_child(k_root_name, root);
   return doc;
}

// ----------------------------------------------------------------------- write
//
void write(const VocDocument& doc,
           const string_view path,
           const bool overwrite) noexcept(false)
{
   std::error_code ec;
   if(!overwrite and std::filesystem::exists(std::filesystem::path(path), ec))
      throw AlreadyExistsError(format("'{}' already exists!", path));

   std::stringstream ss{""};
   pt::write_xml(ss, doc, pt::xml_writer_make_settings<string>(' ', 2));

   ec = file_put_contents(path, ss.str());
   if(ec)
      throw std::runtime_error(
          format("failed to write '{}': {}", path, ec.message()));

   TRACE(format("wrote annotation '{}'", path));
}

// ------------------------------------------------------------------------ read
//
ImageRecord read(const string_view path) noexcept(false)
{
   string raw;
   if(auto ec = file_get_contents(path, raw); ec)
      throw ParseError(format("failed to read '{}': {}", path, ec.message()));

   ImageRecord record;
   try {
      VocDocument doc;
      std::istringstream in(raw);
      pt::read_xml(in, doc);

      for(const auto& [key, obj] : doc.get_child(k_root_name)) {
         if(key != k_object_name) continue;
         record.labels.push_back(obj.get<string>("name"));
         record.boxes.emplace_back(obj.get<int>("bndbox.xmin"),
                                   obj.get<int>("bndbox.ymin"),
                                   obj.get<int>("bndbox.xmax"),
                                   obj.get<int>("bndbox.ymax"));
      }
   } catch(pt::ptree_error& e) {
      throw ParseError(format("failed to parse '{}': {}", path, e.what()));
   }

   Ensures(record.is_consistent());
   return record;
}

// ------------------------------------------------------------- load-and-decode
//
DecodedImage load_and_decode(const string_view image_path) noexcept(false)
{
   DecodedImage ret;
   ret.image = cv::imread(string(image_path), cv::IMREAD_COLOR);
   if(ret.image.empty())
      throw ImageReadError(format("could not read image at '{}'", image_path));

   ret.dims.width  = ret.image.cols;
   ret.dims.height = ret.image.rows;
   ret.dims.depth  = ret.image.channels();
   return ret;
}

// --------------------------------------------------------- annotation-path-for
//
string annotation_path_for(const string_view image_path,
                           const string_view annotation_dir) noexcept
{
   return format("{}/{}{}",
                 annotation_dir,
                 basename(image_path, true),
                 k_annotation_extension);
}

// --------------------------------------------- write-annotation-for-image-file
//
string write_annotation_for_image_file(const string_view image_path,
                                       const vector<string>& labels,
                                       const vector<BoundingBox>& boxes,
                                       const string_view annotation_dir,
                                       const bool overwrite) noexcept(false)
{
   const auto decoded = load_and_decode(image_path);

   const string dir
       = std::filesystem::path(annotation_dir).is_absolute()
             ? string(annotation_dir)
             : format("{}/{}", dirname(absolute_path(image_path)), annotation_dir);

   if(!is_directory(dir) and !mkdir_p(dir))
      throw std::runtime_error(
          format("failed to create annotation directory '{}'", dir));

   const auto fname = annotation_path_for(image_path, dir);
   write(encode(decoded.dims, labels, boxes), fname, overwrite);
   return fname;
}

} // namespace vocmark
