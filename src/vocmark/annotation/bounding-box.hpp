
#pragma once

#include "vocmark/foundation.hpp"

namespace vocmark
{
// Pixel-space box given by two opposite corners. A box fresh off a mouse
// drag may have its corners in any order; see `normalised()`.
struct BoundingBox
{
   int xmin{0}, ymin{0}, xmax{0}, ymax{0};

   BoundingBox() noexcept                   = default;
   BoundingBox(const BoundingBox&) noexcept = default;
   BoundingBox(BoundingBox&&) noexcept      = default;
   ~BoundingBox()                           = default;
   BoundingBox& operator=(const BoundingBox&) noexcept = default;
   BoundingBox& operator=(BoundingBox&&) noexcept = default;

   BoundingBox(int in_xmin, int in_ymin, int in_xmax, int in_ymax) noexcept
       : xmin(in_xmin)
       , ymin(in_ymin)
       , xmax(in_xmax)
       , ymax(in_ymax)
   {}

   bool operator==(const BoundingBox& o) const noexcept
   {
      return xmin == o.xmin and ymin == o.ymin and xmax == o.xmax
             and ymax == o.ymax;
   }
   bool operator!=(const BoundingBox& o) const noexcept
   {
      return !(*this == o);
   }

   int width() const noexcept { return std::abs(xmax - xmin); }
   int height() const noexcept { return std::abs(ymax - ymin); }
   bool is_degenerate() const noexcept { return width() == 0 or height() == 0; }

   // min <= max on both axes
   BoundingBox normalised() const noexcept
   {
      return BoundingBox(std::min(xmin, xmax),
                         std::min(ymin, ymax),
                         std::max(xmin, xmax),
                         std::max(ymin, ymax));
   }

   // Clamp every coordinate into [0, w-1] x [0, h-1]
   BoundingBox clamped(int w, int h) const noexcept
   {
      auto cx = [w](int x) { return std::clamp(x, 0, std::max(0, w - 1)); };
      auto cy = [h](int y) { return std::clamp(y, 0, std::max(0, h - 1)); };
      return BoundingBox(cx(xmin), cy(ymin), cx(xmax), cy(ymax));
   }

   string to_string() const noexcept
   {
      return format("[{}, {}, {}, {}]", xmin, ymin, xmax, ymax);
   }

   friend string str(const BoundingBox& bb) noexcept { return bb.to_string(); }

   friend std::ostream& operator<<(std::ostream& os, const BoundingBox& bb)
   {
      return os << bb.to_string();
   }
};

} // namespace vocmark
