#pragma once

#include "tessel/core/types.hpp"
#include <optional>
#include <span>

namespace tessel::direction_policy {

/**
 * @brief Index of the nearest rectangle on the @p direction side of rects[current].
 *
 * A candidate must lie entirely beyond the matching edge of the current
 * rectangle and overlap it on the perpendicular axis. The closest one wins;
 * on equal distance the top-most (East/West) or left-most (North/South)
 * candidate is chosen. Candidates outside @p container, and rectangles
 * identical to the current one (windows of a deck), are ignored.
 *
 * Returns nullopt when @p current is out of range or nothing lies that way.
 */
std::optional<size_t>
find_neighbor(std::span<Rect const> rects, size_t current, Direction direction, Rect const& container);

} // namespace tessel::direction_policy
