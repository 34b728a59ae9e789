
#pragma once

namespace vocmark::annotate
{
inline string brief() noexcept
{
   return "draw bounding boxes on a folder of images, saving Pascal VOC xml.";
}

int run_main(int argc, char** argv);
} // namespace vocmark::annotate
