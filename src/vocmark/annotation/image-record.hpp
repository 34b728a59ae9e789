
#pragma once

#include "bounding-box.hpp"

namespace vocmark
{
struct ImageDimensions
{
   int width{0};
   int height{0};
   int depth{0}; // number of channels

   string to_string() const noexcept
   {
      return format("{}x{}x{}", width, height, depth);
   }
   friend string str(const ImageDimensions& o) noexcept
   {
      return o.to_string();
   }
};

// The committed boxes of one image. `boxes[i]` carries `labels[i]`.
struct ImageRecord
{
   vector<BoundingBox> boxes;
   vector<string> labels;

   size_t size() const noexcept { return boxes.size(); }
   bool empty() const noexcept { return boxes.empty(); }
   bool is_consistent() const noexcept
   {
      return boxes.size() == labels.size();
   }

   void push_back(const BoundingBox& bb, const string& label)
   {
      boxes.push_back(bb);
      labels.push_back(label);
   }

   void pop_back() noexcept
   {
      if(!boxes.empty()) boxes.pop_back();
      if(!labels.empty()) labels.pop_back();
   }

   void clear() noexcept
   {
      boxes.clear();
      labels.clear();
   }
};

} // namespace vocmark
