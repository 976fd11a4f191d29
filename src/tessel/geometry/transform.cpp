#include "transform.hpp"
#include "tessel/core/log.hpp"
#include <algorithm>

namespace tessel::transform_policy {

namespace {

// Scale an edge offset from an extent of @p from to an extent of @p to.
int32_t rescale(int64_t offset, int64_t from, int64_t to)
{
    if (from == 0)
        return 0;
    return static_cast<int32_t>(offset * to / from);
}

Rect rotate_single(Rect const& rect, Rotation rotation, Rect const& container)
{
    int64_t const w = container.width;
    int64_t const h = container.height;

    // Edges relative to the container origin
    int64_t const left = rect.x - container.x;
    int64_t const top = rect.y - container.y;
    int64_t const far_right = left + rect.width;
    int64_t const far_bottom = top + rect.height;

    int32_t new_left = 0;
    int32_t new_top = 0;
    int32_t new_right = 0;
    int32_t new_bottom = 0;

    switch (rotation)
    {
        case Rotation::North:
            return rect;
        case Rotation::East:
            // (px, py) -> (h - py, px), then scaled from h x w back to w x h
            new_left = rescale(h - far_bottom, h, w);
            new_right = rescale(h - top, h, w);
            new_top = rescale(left, w, h);
            new_bottom = rescale(far_right, w, h);
            break;
        case Rotation::South:
            new_left = static_cast<int32_t>(w - far_right);
            new_right = static_cast<int32_t>(w - left);
            new_top = static_cast<int32_t>(h - far_bottom);
            new_bottom = static_cast<int32_t>(h - top);
            break;
        case Rotation::West:
            // (px, py) -> (py, w - px), then scaled from h x w back to w x h
            new_left = rescale(top, h, w);
            new_right = rescale(far_bottom, h, w);
            new_top = rescale(w - far_right, w, h);
            new_bottom = rescale(w - left, w, h);
            break;
    }

    return Rect{ container.x + new_left, container.y + new_top, new_right - new_left, new_bottom - new_top };
}

} // namespace

void flip(std::span<Rect> rects, Flip flip, Rect const& container)
{
    if (flip == Flip::None)
        return;

    int32_t const container_right = container.x + container.width;
    int32_t const container_bottom = container.y + container.height;

    for (Rect& rect : rects)
    {
        if (is_flipped_horizontal(flip))
        {
            // As far from the left edge as the right side was from the right edge
            rect.x = container.x + (container_right - (rect.x + rect.width));
        }
        if (is_flipped_vertical(flip))
        {
            rect.y = container.y + (container_bottom - (rect.y + rect.height));
        }
    }
}

void rotate(std::span<Rect> rects, Rotation rotation, Rect const& container)
{
    if (rotation == Rotation::North)
        return;

    LOG_TRACE("Rotating {} rects {}", rects.size(), to_string(rotation));
    std::ranges::transform(rects, rects.begin(), [&](Rect const& rect) {
        return rotate_single(rect, rotation, container);
    });
}

} // namespace tessel::transform_policy
