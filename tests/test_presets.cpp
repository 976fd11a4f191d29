#include "tessel/config/presets.hpp"
#include <catch2/catch_test_macros.hpp>
#include <set>

using namespace tessel;

TEST_CASE("Registry holds the built-in presets in order", "[presets][policy]")
{
    Layouts layouts;

    REQUIRE(layouts.size() == 13);
    REQUIRE(layouts[0].name == presets::EVEN_HORIZONTAL);
    REQUIRE(layouts.index_of(presets::MAIN_AND_VERT_STACK) == 4u);
    REQUIRE(layouts.index_of(presets::CENTER_MAIN_FLUID) == 12u);
}

TEST_CASE("Preset names are unique", "[presets]")
{
    auto names = Layouts().names();
    std::set<std::string> unique(names.begin(), names.end());

    REQUIRE(unique.size() == names.size());
}

TEST_CASE("Preset shapes", "[presets]")
{
    REQUIRE(presets::monocle().is_monocle());
    REQUIRE(presets::main_and_deck().is_main_and_deck());
    REQUIRE(presets::right_main_and_vert_stack().flipped == Flip::Horizontal);
    REQUIRE(presets::center_main_balanced().stack_split == Split::Dwindle);
    REQUIRE(presets::center_main_balanced().balance_stacks);
    REQUIRE_FALSE(presets::center_main().balance_stacks);
    REQUIRE(presets::center_main_fluid().reserve_column_space == Reserve::Reserve);
    REQUIRE(presets::grid().stack_split == Split::Grid);
    REQUIRE_FALSE(presets::even_horizontal().has_main());
}

TEST_CASE("Registry lookups by name", "[presets][policy]")
{
    Layouts layouts;

    REQUIRE(layouts.get(presets::GRID) != nullptr);
    REQUIRE(layouts.get(presets::GRID)->stack_split == Split::Grid);
    REQUIRE(layouts.get("NoSuchLayout") == nullptr);
    REQUIRE_FALSE(layouts.index_of("NoSuchLayout").has_value());

    auto* fibonacci = layouts.get_mut(presets::FIBONACCI);
    REQUIRE(fibonacci != nullptr);
    fibonacci->main_window_count = 3;
    REQUIRE(layouts.get(presets::FIBONACCI)->main_window_count == 3);
}

TEST_CASE("append_or_overwrite replaces in place or appends", "[presets][policy]")
{
    Layouts layouts;

    auto grid = presets::grid();
    grid.flipped = Flip::Both;
    layouts.append_or_overwrite(grid);

    REQUIRE(layouts.size() == 13);
    REQUIRE(layouts.index_of(presets::GRID) == 3u);
    REQUIRE(layouts.get(presets::GRID)->flipped == Flip::Both);

    LayoutDefinition custom;
    custom.name = "Custom";
    layouts.append_or_overwrite(custom);

    REQUIRE(layouts.size() == 14);
    REQUIRE(layouts.index_of("Custom") == 13u);
}

TEST_CASE("Registry built from a list drops duplicate names", "[presets][edge]")
{
    auto first = presets::grid();
    auto second = presets::grid();
    second.flipped = Flip::Vertical;

    Layouts layouts({ first, presets::monocle(), second });

    REQUIRE(layouts.size() == 2);
    REQUIRE(layouts[0].flipped == Flip::Vertical);
    REQUIRE(layouts[1].name == presets::MONOCLE);
}

TEST_CASE("Empty registry", "[presets][edge]")
{
    Layouts layouts(std::vector<LayoutDefinition>{});

    REQUIRE(layouts.empty());
    REQUIRE(layouts.names().empty());
    REQUIRE(layouts.get(presets::GRID) == nullptr);
}
