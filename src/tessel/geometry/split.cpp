#include "split.hpp"
#include "rect.hpp"
#include "tessel/core/log.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace tessel::split_policy {

namespace {

size_t ceil_sqrt(size_t n)
{
    auto root = static_cast<size_t>(std::sqrt(static_cast<double>(n)));
    while (root * root < n)
        ++root;
    while (root > 0 && (root - 1) * (root - 1) >= n)
        --root;
    return root;
}

// Halve @p remaining along the cut axis: vertical cuts give left/right halves.
std::pair<Rect, Rect> halve(Rect const& remaining, bool vertical_cut)
{
    auto halves = split_evenly(remaining, 2, vertical_cut ? Axis::Horizontal : Axis::Vertical);
    return { halves[0], halves[1] };
}

} // namespace

std::vector<Rect> split(Rect const& rect, size_t count, Split strategy)
{
    if (count == 0)
        return {};
    if (count == 1)
        return { rect };

    switch (strategy)
    {
        case Split::None:
            throw std::logic_error("Split::None cannot hold " + std::to_string(count) + " windows");
        case Split::Horizontal:
            return horizontal(rect, count);
        case Split::Vertical:
            return vertical(rect, count);
        case Split::Grid:
            return grid(rect, count);
        case Split::Fibonacci:
            return fibonacci(rect, count);
        case Split::Dwindle:
            return dwindle(rect, count);
    }
    throw std::logic_error("unhandled split strategy");
}

std::vector<Rect> horizontal(Rect const& rect, size_t count) { return split_evenly(rect, count, Axis::Vertical); }

std::vector<Rect> vertical(Rect const& rect, size_t count) { return split_evenly(rect, count, Axis::Horizontal); }

std::vector<Rect> grid(Rect const& rect, size_t count)
{
    std::vector<Rect> cells;
    if (count == 0)
        return cells;

    size_t rows = ceil_sqrt(count);
    size_t columns = (count + rows - 1) / rows;
    size_t used_rows = (count + columns - 1) / columns;

    LOG_TRACE("Grid of {} cells: {} rows x {} columns", count, used_rows, columns);

    cells.reserve(count);
    size_t left = count;
    for (Rect const& row : split_evenly(rect, used_rows, Axis::Vertical))
    {
        size_t in_row = std::min(columns, left);
        for (Rect const& cell : split_evenly(row, in_row, Axis::Horizontal))
            cells.push_back(cell);
        left -= in_row;
    }
    return cells;
}

std::vector<Rect> fibonacci(Rect const& rect, size_t count)
{
    std::vector<Rect> tiles;
    tiles.reserve(count);

    Rect remaining = rect;
    bool vertical_cut = true;
    for (size_t i = 0; i < count; ++i)
    {
        if (i + 1 == count)
        {
            tiles.push_back(remaining);
            break;
        }

        auto [first, second] = halve(remaining, vertical_cut);
        tiles.push_back(first);
        remaining = second;
        vertical_cut = !vertical_cut;
    }
    return tiles;
}

std::vector<Rect> dwindle(Rect const& rect, size_t count)
{
    std::vector<Rect> tiles;
    tiles.reserve(count);

    Rect remaining = rect;
    for (size_t i = 0; i < count; ++i)
    {
        if (i + 1 == count)
        {
            tiles.push_back(remaining);
            break;
        }

        // Taken half per step: left, bottom, right, top.
        size_t const phase = i % 4;
        bool const vertical_cut = phase % 2 == 0;
        bool const take_second = phase == 1 || phase == 2;

        auto [first, second] = halve(remaining, vertical_cut);
        tiles.push_back(take_second ? second : first);
        remaining = take_second ? first : second;
    }
    return tiles;
}

} // namespace tessel::split_policy
