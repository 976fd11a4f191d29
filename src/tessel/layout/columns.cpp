#include "columns.hpp"
#include "tessel/core/log.hpp"
#include <algorithm>
#include <array>

namespace tessel::column_policy {

namespace {

// Left-to-right column slot before placement.
struct Slot
{
    Column* column = nullptr;
    int32_t width = 0;
    bool occupied = false; // holds windows
    bool kept = false;     // takes part in the width split
};

int32_t main_width_for(LayoutDefinition const& definition, int32_t total, bool shares_with_stack)
{
    if (!shares_with_stack)
        return total;
    return std::clamp(definition.main_size.into_absolute(total), 0, total);
}

// Place kept slots side by side, or centre the occupied ones for ReserveAndCenter.
template<size_t N>
void place(std::array<Slot, N>& slots, Rect const& workspace, Reserve reserve)
{
    int32_t x = workspace.x;

    if (reserve == Reserve::ReserveAndCenter)
    {
        int32_t occupied_width = 0;
        for (auto const& slot : slots)
        {
            if (slot.occupied)
                occupied_width += slot.width;
        }
        x += (workspace.width - occupied_width) / 2;
    }

    for (auto& slot : slots)
    {
        bool shown = slot.occupied || (slot.kept && reserve == Reserve::Reserve);
        bool advances = slot.occupied || (slot.kept && reserve != Reserve::ReserveAndCenter);

        if (shown)
            slot.column->rect = Rect{ x, workspace.y, slot.width, workspace.height };
        if (advances)
            x += slot.width;
    }
}

void compose_single(ColumnSet& set, Rect const& workspace)
{
    set.first_stack.rect = workspace;
}

void compose_main_and_stack(ColumnSet& set, Rect const& workspace, LayoutDefinition const& definition)
{
    bool const main_on = set.main.window_count > 0;
    bool const stack_on = set.first_stack.window_count > 0 || is_reserved(definition.reserve_column_space);

    int32_t main_width = main_on ? main_width_for(definition, workspace.width, stack_on) : 0;
    int32_t stack_width = workspace.width - main_width;

    std::array<Slot, 2> slots = { {
        { &set.main, main_width, main_on, main_on },
        { &set.first_stack, stack_width, set.first_stack.window_count > 0, stack_on },
    } };
    place(slots, workspace, definition.reserve_column_space);
}

void compose_center_main(ColumnSet& set, Rect const& workspace, LayoutDefinition const& definition)
{
    bool const reserved = is_reserved(definition.reserve_column_space);
    bool const main_on = set.main.window_count > 0;
    bool const first_on = set.first_stack.window_count > 0 || reserved;
    bool const second_on = set.second_stack.window_count > 0 || reserved;

    int32_t main_width = main_on ? main_width_for(definition, workspace.width, first_on || second_on) : 0;
    int32_t stack_width = workspace.width - main_width;
    int32_t first_width = first_on ? (second_on ? stack_width / 2 : stack_width) : 0;
    int32_t second_width = second_on ? stack_width - first_width : 0;

    std::array<Slot, 3> slots = { {
        { &set.first_stack, first_width, set.first_stack.window_count > 0, first_on },
        { &set.main, main_width, main_on, main_on },
        { &set.second_stack, second_width, set.second_stack.window_count > 0, second_on },
    } };
    place(slots, workspace, definition.reserve_column_space);
}

} // namespace

size_t main_capacity(LayoutDefinition const& definition)
{
    if (!definition.has_main())
        return 0;
    if (definition.main_split == Split::None)
        return std::min<size_t>(definition.main_window_count, 1);
    return definition.main_window_count;
}

ColumnSet allocate(size_t window_count, LayoutDefinition const& definition)
{
    ColumnSet set;

    size_t const capacity = main_capacity(definition);
    set.main.window_count = std::min(capacity, window_count);
    size_t const stack_count = window_count - set.main.window_count;

    if (capacity < definition.main_window_count && stack_count > 0 && definition.has_main())
    {
        LOG_DEBUG(
            "Main column of {} holds at most {} window(s), {} rerouted to the stack",
            definition.name,
            capacity,
            std::min(definition.main_window_count, window_count) - set.main.window_count
        );
    }

    switch (definition.column_type)
    {
        case ColumnType::Stack:
        case ColumnType::MainAndStack:
            set.first_stack.window_count = stack_count;
            break;
        case ColumnType::CenterMain:
            if (definition.balance_stacks)
            {
                set.first_stack.window_count = (stack_count + 1) / 2;
                set.second_stack.window_count = stack_count / 2;
            }
            else
            {
                set.first_stack.window_count = stack_count;
            }
            break;
    }

    LOG_TRACE(
        "Allocated {} windows: main={} first={} second={}",
        window_count,
        set.main.window_count,
        set.first_stack.window_count,
        set.second_stack.window_count
    );
    return set;
}

ColumnSet compose(Rect const& workspace, size_t window_count, LayoutDefinition const& definition)
{
    ColumnSet set = allocate(window_count, definition);
    if (window_count == 0)
        return set;

    switch (definition.column_type)
    {
        case ColumnType::Stack:
            compose_single(set, workspace);
            break;
        case ColumnType::MainAndStack:
            compose_main_and_stack(set, workspace, definition);
            break;
        case ColumnType::CenterMain:
            compose_center_main(set, workspace, definition);
            break;
    }

    LOG_RECT("main", set.main.rect.value_or(Rect{}));
    LOG_RECT("first stack", set.first_stack.rect.value_or(Rect{}));
    LOG_RECT("second stack", set.second_stack.rect.value_or(Rect{}));
    return set;
}

} // namespace tessel::column_policy
