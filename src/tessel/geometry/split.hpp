#pragma once

#include "tessel/core/types.hpp"
#include <vector>

namespace tessel {

namespace split_policy {

/**
 * @brief Subdivide @p rect among @p count windows using @p strategy.
 *
 * Returns exactly @p count rectangles that tile @p rect. Zero windows give an
 * empty vector and one window gets the whole rectangle, whatever the strategy.
 *
 * @throws std::logic_error if @p strategy is Split::None and @p count > 1.
 *         Column composition never asks for that.
 */
std::vector<Rect> split(Rect const& rect, size_t count, Split strategy);

/// Rows stacked top to bottom, full width.
std::vector<Rect> horizontal(Rect const& rect, size_t count);

/// Columns side by side, full height.
std::vector<Rect> vertical(Rect const& rect, size_t count);

/**
 * Near-square tiling: ceil(sqrt(n)) rows of ceil(n / rows) cells, filled
 * row-major. The last row holds what is left and stretches it over the
 * full width.
 *
 * ```
 * +---+---+
 * | 1 | 2 |
 * +---+---+
 * |   3   |
 * +-------+
 * ```
 */
std::vector<Rect> grid(Rect const& rect, size_t count);

/**
 * Each window takes the left or top half of what is left, the cut axis
 * alternating vertical, horizontal, vertical, ...
 *
 * ```
 * +-------+---+---+
 * |       |   2   |
 * |   1   +---+---+
 * |       | 3 | 4 |
 * +-------+---+---+
 * ```
 */
std::vector<Rect> fibonacci(Rect const& rect, size_t count);

/**
 * Same halving as fibonacci(), but the half a window takes walks around
 * left, bottom, right, top so the windows spiral inward.
 *
 * ```
 * +-------+---+---+
 * |       | 4 | 3 |
 * |   1   +---+---+
 * |       |   2   |
 * +-------+-------+
 * ```
 */
std::vector<Rect> dwindle(Rect const& rect, size_t count);

} // namespace split_policy

} // namespace tessel
