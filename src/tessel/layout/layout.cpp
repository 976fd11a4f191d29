#include "layout.hpp"
#include "columns.hpp"
#include "tessel/core/invariants.hpp"
#include "tessel/core/log.hpp"
#include "tessel/geometry/rect.hpp"
#include "tessel/geometry/split.hpp"
#include "tessel/geometry/transform.hpp"

namespace tessel::layout_policy {

namespace {

void append_column(std::vector<Rect>& tiles, Column const& column, Split split)
{
    if (column.window_count == 0 || !column.rect)
        return;

    // A None-split column with several windows is a deck: all windows share it.
    if (split == Split::None)
    {
        tiles.insert(tiles.end(), column.window_count, *column.rect);
        return;
    }

    auto pieces = split_policy::split(*column.rect, column.window_count, split);
    tiles.insert(tiles.end(), pieces.begin(), pieces.end());
}

} // namespace

std::vector<Rect> resolve(Rect const& workspace, size_t window_count, LayoutDefinition const& definition)
{
    validate(workspace);

    std::vector<Rect> tiles;
    if (window_count == 0)
        return tiles;

    tiles.reserve(window_count);

    ColumnSet columns = column_policy::compose(workspace, window_count, definition);
    append_column(tiles, columns.main, definition.main_split);
    append_column(tiles, columns.first_stack, definition.stack_split);
    append_column(tiles, columns.second_stack, definition.stack_split);

    transform_policy::flip(tiles, definition.flipped, workspace);
    transform_policy::rotate(tiles, definition.rotation, workspace);

    LOG_TRACE("Resolved {} windows with layout {}", tiles.size(), definition.name);
    TESSEL_ASSERT_TILING(workspace, tiles, window_count, definition.name, definition.reserve_column_space);
    return tiles;
}

} // namespace tessel::layout_policy
