
#pragma once

#include "errors.hpp"
#include "image-record.hpp"

#include <boost/property_tree/ptree.hpp>
#include <opencv2/core/core.hpp>

namespace vocmark
{
using VocDocument = boost::property_tree::ptree;

constexpr const char* k_annotation_dir       = "Annotations";
constexpr const char* k_annotation_extension = ".xml";

/**
 * Builds a Pascal VOC tree: a `size` block followed by one `object` block
 * per (label, box) pair, in input order.
 *
 * @throws std::invalid_argument if `labels` and `boxes` differ in length
 */
VocDocument encode(const ImageDimensions& dims,
                   const vector<string>& labels,
                   const vector<BoundingBox>& boxes) noexcept(false);

/**
 * Pretty-prints `doc` to `path`, replacing any prior content.
 *
 * @throws AlreadyExistsError if `path` exists and `overwrite` is false
 * @throws std::runtime_error if the file cannot be written
 */
void write(const VocDocument& doc,
           const string_view path,
           const bool overwrite) noexcept(false);

/**
 * The boxes and labels of every `object` block in `path`, in document order.
 *
 * @throws ParseError on malformed XML, missing fields, or non-integer
 *         coordinates
 */
ImageRecord read(const string_view path) noexcept(false);

struct DecodedImage
{
   cv::Mat image;
   ImageDimensions dims;
};

/// @throws ImageReadError if `image_path` does not decode as an image
DecodedImage load_and_decode(const string_view image_path) noexcept(false);

/// `<annotation_dir>/<image-stem>.xml`
string annotation_path_for(const string_view image_path,
                           const string_view annotation_dir) noexcept;

/**
 * Decodes `image_path` for its dimensions, then writes its annotation file
 * into `annotation_dir`. A relative `annotation_dir` is taken relative to the
 * image's folder, and is created if missing. Returns the written filename.
 */
string write_annotation_for_image_file(const string_view image_path,
                                       const vector<string>& labels,
                                       const vector<BoundingBox>& boxes,
                                       const string_view annotation_dir
                                       = k_annotation_dir,
                                       const bool overwrite
                                       = false) noexcept(false);

} // namespace vocmark
