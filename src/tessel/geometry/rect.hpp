#pragma once

#include "tessel/core/types.hpp"
#include <vector>

namespace tessel {

/// Build a rectangle, throwing InvalidGeometry on a negative dimension.
Rect make_rect(int32_t x, int32_t y, int32_t width, int32_t height);

/// Throw InvalidGeometry if @p rect has a negative dimension.
void validate(Rect const& rect);

inline int64_t area(Rect const& rect) { return static_cast<int64_t>(rect.width) * rect.height; }
inline int32_t right(Rect const& rect) { return rect.x + rect.width; }
inline int32_t bottom(Rect const& rect) { return rect.y + rect.height; }
inline bool is_empty(Rect const& rect) { return rect.width == 0 || rect.height == 0; }

/// Half-open containment: the right and bottom edges are outside.
inline bool contains(Rect const& rect, Point p)
{
    return p.x >= rect.x && p.x < right(rect) && p.y >= rect.y && p.y < bottom(rect);
}

inline Point center(Rect const& rect) { return Point{ rect.x + rect.width / 2, rect.y + rect.height / 2 }; }

/**
 * @brief Divide @p total into @p count parts that differ by at most one.
 *
 * Remainder units go to the earliest parts: (11, 3) gives {4, 4, 3}.
 * A count of zero gives an empty vector.
 */
std::vector<int32_t> remainderless_division(int32_t total, size_t count);

/**
 * @brief Cut @p rect into @p count pieces laid out along @p axis.
 *
 * Pieces tile @p rect exactly; sizes come from remainderless_division().
 */
std::vector<Rect> split_evenly(Rect const& rect, size_t count, Axis axis);

/**
 * @brief Proportional sub-rectangle of @p rect.
 *
 * Edges are floored independently, so two subrects sharing a ratio boundary
 * share the pixel edge as well.
 */
Rect subrect(Rect const& rect, double x_ratio, double y_ratio, double w_ratio, double h_ratio);

} // namespace tessel
