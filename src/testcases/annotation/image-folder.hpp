
#pragma once

#include "stdinc.hpp"

#include <opencv2/core/core.hpp>
#include <opencv2/imgcodecs/imgcodecs.hpp>

namespace vocmark::testing
{
// A temporary folder of solid black images, removed on destruction.
struct ImageFolder
{
   string dir;
   vector<string> images;

   explicit ImageFolder(int n_images,
                        int w          = 100,
                        int h          = 80,
                        const string& ext = ".jpg")
       : dir(make_temp_directory("/tmp/vocmark-testcase-"))
   {
      const cv::Mat im(h, w, CV_8UC3, cv::Scalar(0, 0, 0));
      for(int i = 0; i < n_images; ++i) {
         images.push_back(format("{}/image-{:03d}{}", dir, i, ext));
         if(!cv::imwrite(images.back(), im))
            throw std::runtime_error(
                format("failed to write test image '{}'", images.back()));
      }
   }

   ImageFolder(const ImageFolder&) = delete;
   ImageFolder& operator=(const ImageFolder&) = delete;

   ~ImageFolder()
   {
      try {
         remove_all(dir);
      } catch(std::exception& e) {
         WARN(format("failed to remove test folder: {}", e.what()));
      }
   }

   string annotation(int i) const
   {
      return format("{}/Annotations/image-{:03d}.xml", dir, i);
   }
};

} // namespace vocmark::testing
