
#pragma once

#include "bounding-box.hpp"

namespace vocmark
{
/**
 * Parses a command-line box "xmin,ymin,xmax,ymax". Whitespace around each
 * coordinate is allowed. Coordinates are stored as given.
 *
 * @throws std::invalid_argument unless there are exactly four integers
 */
BoundingBox parse_box_argument(const string_view s) noexcept(false);

/**
 * Pairs labels with boxes: either one label per box, or a single label
 * that every box gets.
 *
 * @throws std::invalid_argument for any other label count
 */
vector<string> labels_for_boxes(const vector<string>& labels,
                                const size_t n_boxes) noexcept(false);

} // namespace vocmark
