#include "direction.hpp"
#include "rect.hpp"
#include <limits>

namespace tessel::direction_policy {

namespace {

bool overlaps_horizontally(Rect const& a, Rect const& b) { return a.x < right(b) && b.x < right(a); }
bool overlaps_vertically(Rect const& a, Rect const& b) { return a.y < bottom(b) && b.y < bottom(a); }

bool intersects(Rect const& a, Rect const& b) { return overlaps_horizontally(a, b) && overlaps_vertically(a, b); }

// Gap between @p from and @p candidate along @p direction, nullopt if the candidate is not on that side.
std::optional<int32_t> distance(Rect const& from, Rect const& candidate, Direction direction)
{
    switch (direction)
    {
        case Direction::North:
            if (bottom(candidate) > from.y || !overlaps_horizontally(from, candidate))
                return std::nullopt;
            return from.y - bottom(candidate);
        case Direction::South:
            if (candidate.y < bottom(from) || !overlaps_horizontally(from, candidate))
                return std::nullopt;
            return candidate.y - bottom(from);
        case Direction::West:
            if (right(candidate) > from.x || !overlaps_vertically(from, candidate))
                return std::nullopt;
            return from.x - right(candidate);
        case Direction::East:
            if (candidate.x < right(from) || !overlaps_vertically(from, candidate))
                return std::nullopt;
            return candidate.x - right(from);
    }
    return std::nullopt;
}

int32_t tie_break_key(Rect const& candidate, Direction direction)
{
    return (direction == Direction::North || direction == Direction::South) ? candidate.x : candidate.y;
}

} // namespace

std::optional<size_t>
find_neighbor(std::span<Rect const> rects, size_t current, Direction direction, Rect const& container)
{
    if (current >= rects.size())
        return std::nullopt;

    Rect const& from = rects[current];
    std::optional<size_t> best;
    int32_t best_distance = std::numeric_limits<int32_t>::max();
    int32_t best_key = std::numeric_limits<int32_t>::max();

    for (size_t i = 0; i < rects.size(); ++i)
    {
        if (i == current || rects[i] == from || !intersects(rects[i], container))
            continue;

        auto gap = distance(from, rects[i], direction);
        if (!gap)
            continue;

        int32_t key = tie_break_key(rects[i], direction);
        if (*gap < best_distance || (*gap == best_distance && key < best_key))
        {
            best = i;
            best_distance = *gap;
            best_key = key;
        }
    }
    return best;
}

} // namespace tessel::direction_policy
