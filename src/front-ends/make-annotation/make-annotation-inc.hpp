
#pragma once

namespace vocmark::make_annotation
{
inline string brief() noexcept
{
   return "write a Pascal VOC annotation file for a single image.";
}

int run_main(int argc, char** argv);
} // namespace vocmark::make_annotation
