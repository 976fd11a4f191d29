#pragma once

#include "tessel/core/types.hpp"
#include "tessel/layout/definition.hpp"
#include <optional>

namespace tessel {

/**
 * @brief One column of a layout after composition.
 *
 * A column with windows always has a rectangle. An empty column only has one
 * when Reserve::Reserve keeps its space blank; otherwise its space went to
 * its neighbours and rect is nullopt.
 */
struct Column
{
    std::optional<Rect> rect;
    size_t window_count = 0;

    bool operator==(Column const&) const = default;
};

/**
 * @brief Column rectangles and window allocation for one resolve.
 *
 * The window counts of the three columns always sum to the resolved window
 * count. Single-column layouts only use first_stack.
 */
struct ColumnSet
{
    Column main;
    Column first_stack;
    Column second_stack;

    size_t total_windows() const { return main.window_count + first_stack.window_count + second_stack.window_count; }
};

namespace column_policy {

/// Windows the main column may hold: main_window_count, capped at one for Split::None.
size_t main_capacity(LayoutDefinition const& definition);

/**
 * @brief Split @p window_count windows across the columns of @p definition.
 *
 * Main takes min(main_capacity, window_count), the rest go to the stack(s).
 * For CenterMain with balance_stacks the first stack takes the larger half.
 */
ColumnSet allocate(size_t window_count, LayoutDefinition const& definition);

/**
 * @brief Compute column rectangles and window counts inside @p workspace.
 *
 * Columns span the full workspace height. Zero windows give a set without
 * any rectangle; a zero-sized workspace gives zero-sized rectangles.
 */
ColumnSet compose(Rect const& workspace, size_t window_count, LayoutDefinition const& definition);

} // namespace column_policy

} // namespace tessel
