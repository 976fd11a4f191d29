#pragma once

/**
 * @file invariants.hpp
 * @brief Debug assertions for layout invariants
 *
 * These assertions verify what every resolve must guarantee. They are enabled
 * in debug builds and compiled out in release builds.
 *
 * Key invariants:
 * 1. One rectangle per window
 * 2. No rectangle with a negative dimension
 * 3. Every rectangle lies inside the workspace
 * 4. Rectangles never overlap, except windows of a deck which share one
 * 5. Without a reserve policy or a deck, the rectangles cover the workspace
 */

#include "log.hpp"
#include "types.hpp"
#include <cstdint>
#include <string_view>
#include <vector>

namespace tessel::invariants {

#ifdef NDEBUG
// Release build: no-op
#    define TESSEL_ASSERT_TILING(workspace, rects, window_count, layout_name, reserve)
#else

inline bool rect_inside(Rect const& outer, Rect const& inner)
{
    return inner.x >= outer.x && inner.y >= outer.y && inner.x + inner.width <= outer.x + outer.width
        && inner.y + inner.height <= outer.y + outer.height;
}

inline bool rects_overlap(Rect const& a, Rect const& b)
{
    return a.x < b.x + b.width && b.x < a.x + a.width && a.y < b.y + b.height && b.y < a.y + a.height;
}

/**
 * @brief Assert the geometric invariants of a resolved layout
 *
 * Violations are logged, never thrown: a slightly wrong layout is better
 * than none for the window manager consuming it.
 */
inline void assert_tiling(
    Rect const& workspace,
    std::vector<Rect> const& rects,
    size_t window_count,
    std::string_view layout_name,
    Reserve reserve
)
{
    if (rects.size() != window_count)
    {
        LOG_ERROR(
            "INVARIANT VIOLATION: Layout {} produced {} rects for {} windows",
            layout_name,
            rects.size(),
            window_count
        );
    }

    bool has_deck = false;
    int64_t covered = 0;

    for (size_t i = 0; i < rects.size(); ++i)
    {
        Rect const& rect = rects[i];
        if (rect.width < 0 || rect.height < 0)
        {
            LOG_ERROR("INVARIANT VIOLATION: Rect {} of layout {} has negative size", i, layout_name);
        }
        if (!rect_inside(workspace, rect))
        {
            LOG_ERROR("INVARIANT VIOLATION: Rect {} of layout {} leaves the workspace", i, layout_name);
        }

        bool duplicate = false;
        for (size_t j = 0; j < i; ++j)
        {
            if (rects[j] == rect)
            {
                duplicate = true;
                continue;
            }
            if (rects_overlap(rects[j], rect))
            {
                LOG_ERROR("INVARIANT VIOLATION: Rects {} and {} of layout {} overlap", j, i, layout_name);
            }
        }

        if (duplicate)
            has_deck = true;
        else
            covered += static_cast<int64_t>(rect.width) * rect.height;
    }

    int64_t const workspace_area = static_cast<int64_t>(workspace.width) * workspace.height;
    if (!rects.empty() && !has_deck && !is_reserved(reserve) && covered != workspace_area)
    {
        LOG_ERROR(
            "INVARIANT VIOLATION: Layout {} covers {} of {} workspace pixels",
            layout_name,
            covered,
            workspace_area
        );
    }
}

#    define TESSEL_ASSERT_TILING(workspace, rects, window_count, layout_name, reserve) \
        ::tessel::invariants::assert_tiling(workspace, rects, window_count, layout_name, reserve)

#endif

} // namespace tessel::invariants
