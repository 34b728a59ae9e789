
#include "stdinc.hpp"

#include "box-arguments.hpp"

#include <boost/lexical_cast.hpp>

namespace vocmark
{
// ----------------------------------------------------------- parse-box-argument
//
BoundingBox parse_box_argument(const string_view s) noexcept(false)
{
   const auto parts = explode(s, ",");
   if(parts.size() != 4)
      throw std::invalid_argument(
          format("expected 'xmin,ymin,xmax,ymax', but got '{}'", s));

   array<int, 4> v;
   for(size_t i = 0; i < v.size(); ++i) {
      try {
         v[i] = boost::lexical_cast<int>(trim_copy(parts[i]));
      } catch(boost::bad_lexical_cast&) {
         throw std::invalid_argument(format(
             "bounding box coordinate '{}' in '{}' is not an integer",
             parts[i],
             s));
      }
   }

   return BoundingBox(v[0], v[1], v[2], v[3]);
}

// ------------------------------------------------------------ labels-for-boxes
//
vector<string> labels_for_boxes(const vector<string>& labels,
                                const size_t n_boxes) noexcept(false)
{
   if(labels.size() == 1) return vector<string>(n_boxes, labels.front());
   if(labels.size() != n_boxes)
      throw std::invalid_argument(
          format("got {} labels for {} boxes", labels.size(), n_boxes));
   return labels;
}

} // namespace vocmark
