#pragma once

#include "tessel/layout/definition.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tessel {

namespace presets {

inline constexpr std::string_view EVEN_HORIZONTAL = "EvenHorizontal";
inline constexpr std::string_view EVEN_VERTICAL = "EvenVertical";
inline constexpr std::string_view MONOCLE = "Monocle";
inline constexpr std::string_view GRID = "Grid";
inline constexpr std::string_view MAIN_AND_VERT_STACK = "MainAndVertStack";
inline constexpr std::string_view MAIN_AND_HORIZONTAL_STACK = "MainAndHorizontalStack";
inline constexpr std::string_view RIGHT_MAIN_AND_VERT_STACK = "RightMainAndVertStack";
inline constexpr std::string_view FIBONACCI = "Fibonacci";
inline constexpr std::string_view DWINDLE = "Dwindle";
inline constexpr std::string_view MAIN_AND_DECK = "MainAndDeck";
inline constexpr std::string_view CENTER_MAIN = "CenterMain";
inline constexpr std::string_view CENTER_MAIN_BALANCED = "CenterMainBalanced";
inline constexpr std::string_view CENTER_MAIN_FLUID = "CenterMainFluid";

LayoutDefinition even_horizontal();
LayoutDefinition even_vertical();
LayoutDefinition monocle();
LayoutDefinition grid();
LayoutDefinition main_and_vert_stack();
LayoutDefinition main_and_horizontal_stack();
LayoutDefinition right_main_and_vert_stack();
LayoutDefinition fibonacci();
LayoutDefinition dwindle();
LayoutDefinition main_and_deck();
LayoutDefinition center_main();
LayoutDefinition center_main_balanced();
LayoutDefinition center_main_fluid();

/// Every built-in layout, in cycling order.
std::vector<LayoutDefinition> all();

} // namespace presets

/**
 * @brief Ordered, name-keyed set of layout definitions.
 *
 * Window managers cycle through it; the resolver never sees names.
 * Names are unique within a registry.
 */
class Layouts
{
public:
    /// The built-in presets.
    Layouts();
    explicit Layouts(std::vector<LayoutDefinition> layouts);

    LayoutDefinition const* get(std::string_view name) const;
    LayoutDefinition* get_mut(std::string_view name);
    std::optional<size_t> index_of(std::string_view name) const;
    std::vector<std::string> names() const;

    /// Replace the layout of the same name in place, or append a new one.
    void append_or_overwrite(LayoutDefinition layout);

    size_t size() const { return layouts_.size(); }
    bool empty() const { return layouts_.empty(); }

    std::vector<LayoutDefinition> const& all() const { return layouts_; }
    LayoutDefinition const& operator[](size_t index) const { return layouts_[index]; }

private:
    std::vector<LayoutDefinition> layouts_;
};

} // namespace tessel
