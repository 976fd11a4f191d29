#include "presets.hpp"
#include <algorithm>
#include <iterator>
#include <utility>

namespace tessel {

namespace presets {

namespace {

LayoutDefinition named(std::string_view name, ColumnType column_type)
{
    LayoutDefinition layout;
    layout.name = std::string(name);
    layout.column_type = column_type;
    return layout;
}

} // namespace

LayoutDefinition even_horizontal()
{
    auto layout = named(EVEN_HORIZONTAL, ColumnType::Stack);
    layout.stack_split = Split::Vertical;
    return layout;
}

LayoutDefinition even_vertical()
{
    auto layout = named(EVEN_VERTICAL, ColumnType::Stack);
    layout.stack_split = Split::Horizontal;
    return layout;
}

LayoutDefinition monocle()
{
    auto layout = named(MONOCLE, ColumnType::Stack);
    layout.main_split = Split::None;
    layout.stack_split = Split::None;
    return layout;
}

LayoutDefinition grid()
{
    auto layout = named(GRID, ColumnType::Stack);
    layout.stack_split = Split::Grid;
    return layout;
}

LayoutDefinition main_and_vert_stack() { return named(MAIN_AND_VERT_STACK, ColumnType::MainAndStack); }

LayoutDefinition main_and_horizontal_stack()
{
    auto layout = named(MAIN_AND_HORIZONTAL_STACK, ColumnType::MainAndStack);
    layout.stack_split = Split::Vertical;
    return layout;
}

LayoutDefinition right_main_and_vert_stack()
{
    auto layout = named(RIGHT_MAIN_AND_VERT_STACK, ColumnType::MainAndStack);
    layout.flipped = Flip::Horizontal;
    return layout;
}

LayoutDefinition fibonacci()
{
    auto layout = named(FIBONACCI, ColumnType::MainAndStack);
    layout.stack_split = Split::Fibonacci;
    return layout;
}

LayoutDefinition dwindle()
{
    auto layout = named(DWINDLE, ColumnType::MainAndStack);
    layout.stack_split = Split::Dwindle;
    return layout;
}

LayoutDefinition main_and_deck()
{
    auto layout = named(MAIN_AND_DECK, ColumnType::MainAndStack);
    layout.main_split = Split::None;
    layout.stack_split = Split::None;
    return layout;
}

LayoutDefinition center_main()
{
    auto layout = named(CENTER_MAIN, ColumnType::CenterMain);
    layout.balance_stacks = false;
    return layout;
}

LayoutDefinition center_main_balanced()
{
    auto layout = named(CENTER_MAIN_BALANCED, ColumnType::CenterMain);
    layout.stack_split = Split::Dwindle;
    layout.balance_stacks = true;
    return layout;
}

LayoutDefinition center_main_fluid()
{
    auto layout = named(CENTER_MAIN_FLUID, ColumnType::CenterMain);
    layout.reserve_column_space = Reserve::Reserve;
    return layout;
}

std::vector<LayoutDefinition> all()
{
    return {
        even_horizontal(),
        even_vertical(),
        monocle(),
        grid(),
        main_and_vert_stack(),
        main_and_horizontal_stack(),
        right_main_and_vert_stack(),
        fibonacci(),
        dwindle(),
        main_and_deck(),
        center_main(),
        center_main_balanced(),
        center_main_fluid(),
    };
}

} // namespace presets

Layouts::Layouts()
    : layouts_(presets::all())
{ }

Layouts::Layouts(std::vector<LayoutDefinition> layouts)
{
    for (auto& layout : layouts)
        append_or_overwrite(std::move(layout));
}

LayoutDefinition const* Layouts::get(std::string_view name) const
{
    auto it = std::ranges::find_if(layouts_, [&](auto const& layout) { return layout.name == name; });
    return it != layouts_.end() ? &*it : nullptr;
}

LayoutDefinition* Layouts::get_mut(std::string_view name)
{
    auto it = std::ranges::find_if(layouts_, [&](auto const& layout) { return layout.name == name; });
    return it != layouts_.end() ? &*it : nullptr;
}

std::optional<size_t> Layouts::index_of(std::string_view name) const
{
    auto it = std::ranges::find_if(layouts_, [&](auto const& layout) { return layout.name == name; });
    if (it == layouts_.end())
        return std::nullopt;
    return static_cast<size_t>(std::distance(layouts_.begin(), it));
}

std::vector<std::string> Layouts::names() const
{
    std::vector<std::string> result;
    result.reserve(layouts_.size());
    for (auto const& layout : layouts_)
        result.push_back(layout.name);
    return result;
}

void Layouts::append_or_overwrite(LayoutDefinition layout)
{
    if (auto* existing = get_mut(layout.name))
    {
        *existing = std::move(layout);
        return;
    }
    layouts_.push_back(std::move(layout));
}

} // namespace tessel
