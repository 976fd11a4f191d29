#include "definition.hpp"
#include "tessel/core/log.hpp"
#include <algorithm>
#include <limits>

namespace tessel {

std::optional<size_t> LayoutDefinition::get_main_window_count() const
{
    if (!has_main())
        return std::nullopt;
    return main_window_count;
}

std::optional<Size> LayoutDefinition::get_main_size() const
{
    if (!has_main())
        return std::nullopt;
    return main_size;
}

void LayoutDefinition::set_main_size(Size size)
{
    main_size = size.is_pixel() ? Size::pixel(size.pixels) : Size::of_ratio(size.ratio);
}

void LayoutDefinition::change_main_size(int32_t delta, int32_t upper_bound)
{
    upper_bound = std::max(0, upper_bound);

    if (main_size.is_pixel())
    {
        int64_t grown = static_cast<int64_t>(main_size.pixels) + delta;
        main_size = Size::pixel(static_cast<int32_t>(std::clamp<int64_t>(grown, 0, upper_bound)));
    }
    else
    {
        double percent = main_size.ratio * 100.0 + delta;
        double bound = std::min(100.0, static_cast<double>(upper_bound));
        main_size = Size::of_ratio(std::clamp(percent, 0.0, bound) / 100.0);
    }

    LOG_DEBUG("Layout {} main size changed by {} to {}", name, delta, to_string(main_size));
}

void LayoutDefinition::increase_main_size(int32_t upper_bound)
{
    if (main_size.is_pixel())
    {
        int64_t grown = static_cast<int64_t>(main_size.pixels) + MAIN_SIZE_PIXEL_STEP;
        main_size = Size::pixel(static_cast<int32_t>(std::min<int64_t>(grown, std::max(0, upper_bound))));
    }
    else
    {
        main_size = Size::of_ratio(std::min(1.0, main_size.ratio + MAIN_SIZE_RATIO_STEP));
    }
}

void LayoutDefinition::decrease_main_size()
{
    if (main_size.is_pixel())
        main_size = Size::pixel(std::max(0, main_size.pixels - MAIN_SIZE_PIXEL_STEP));
    else
        main_size = Size::of_ratio(std::max(0.0, main_size.ratio - MAIN_SIZE_RATIO_STEP));
}

void LayoutDefinition::set_main_window_count(size_t count) { main_window_count = count; }

void LayoutDefinition::increase_main_window_count()
{
    if (main_window_count < std::numeric_limits<size_t>::max())
        ++main_window_count;
}

void LayoutDefinition::decrease_main_window_count()
{
    if (main_window_count > 0)
        --main_window_count;
}

void LayoutDefinition::rotate(bool clockwise_turn)
{
    rotation = clockwise_turn ? clockwise(rotation) : counter_clockwise(rotation);
}

void LayoutDefinition::toggle_flip_horizontal() { flipped = toggle_horizontal(flipped); }

void LayoutDefinition::toggle_flip_vertical() { flipped = toggle_vertical(flipped); }

bool LayoutDefinition::is_monocle() const { return column_type == ColumnType::Stack && stack_split == Split::None; }

bool LayoutDefinition::is_main_and_deck() const
{
    return column_type == ColumnType::MainAndStack && main_split == Split::None && stack_split == Split::None;
}

} // namespace tessel
