#include "rect.hpp"
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace tessel {

namespace {

int32_t scaled(int32_t extent, double ratio)
{
    return static_cast<int32_t>(std::floor(static_cast<double>(extent) * std::clamp(ratio, 0.0, 1.0)));
}

} // namespace

Rect make_rect(int32_t x, int32_t y, int32_t width, int32_t height)
{
    Rect rect{ x, y, width, height };
    validate(rect);
    return rect;
}

void validate(Rect const& rect)
{
    if (rect.width < 0 || rect.height < 0)
    {
        throw InvalidGeometry(
            fmt::format("rectangle at ({}, {}) has negative size {}x{}", rect.x, rect.y, rect.width, rect.height)
        );
    }
}

std::vector<int32_t> remainderless_division(int32_t total, size_t count)
{
    std::vector<int32_t> parts;
    if (count == 0)
        return parts;

    auto const n = static_cast<int64_t>(count);
    auto const base = static_cast<int32_t>(total / n);
    auto remainder = static_cast<int64_t>(total % n);

    parts.reserve(count);
    for (size_t i = 0; i < count; ++i)
    {
        if (remainder > 0)
        {
            parts.push_back(base + 1);
            --remainder;
        }
        else
        {
            parts.push_back(base);
        }
    }
    return parts;
}

std::vector<Rect> split_evenly(Rect const& rect, size_t count, Axis axis)
{
    std::vector<Rect> pieces;
    pieces.reserve(count);

    if (axis == Axis::Horizontal)
    {
        int32_t from_left = rect.x;
        for (int32_t width : remainderless_division(rect.width, count))
        {
            pieces.push_back(Rect{ from_left, rect.y, width, rect.height });
            from_left += width;
        }
    }
    else
    {
        int32_t from_top = rect.y;
        for (int32_t height : remainderless_division(rect.height, count))
        {
            pieces.push_back(Rect{ rect.x, from_top, rect.width, height });
            from_top += height;
        }
    }
    return pieces;
}

Rect subrect(Rect const& rect, double x_ratio, double y_ratio, double w_ratio, double h_ratio)
{
    int32_t left = scaled(rect.width, x_ratio);
    int32_t top = scaled(rect.height, y_ratio);
    int32_t far_right = scaled(rect.width, x_ratio + w_ratio);
    int32_t far_bottom = scaled(rect.height, y_ratio + h_ratio);

    return Rect{ rect.x + left, rect.y + top, far_right - left, far_bottom - top };
}

} // namespace tessel
