#pragma once

#include "tessel/core/types.hpp"
#include <span>

namespace tessel::transform_policy {

/**
 * @brief Mirror @p rects inside @p container.
 *
 * Flip::Horizontal mirrors the x axis (columns swap sides), Flip::Vertical
 * mirrors the y axis (rows swap order), Flip::Both does both.
 */
void flip(std::span<Rect> rects, Flip flip, Rect const& container);

/**
 * @brief Rotate the arrangement @p rects inside @p container.
 *
 * East/West rotations swap the aspect ratio, so the result is rescaled to
 * fill @p container again. Rectangle edges are mapped rather than sizes:
 * rectangles that shared an edge before share it afterwards, so a gap-free,
 * overlap-free input stays gap-free and overlap-free.
 */
void rotate(std::span<Rect> rects, Rotation rotation, Rect const& container);

} // namespace tessel::transform_policy
