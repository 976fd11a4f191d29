#include "tessel/config/config.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace tessel;

TEST_CASE("Empty document yields the built-in layouts", "[config][policy]")
{
    auto config = parse_config("");

    REQUIRE(config.has_value());
    REQUIRE(config->layouts.size() == Layouts().size());
    REQUIRE(config->default_layout == presets::MAIN_AND_VERT_STACK);
    REQUIRE(config->demo.width == 42);
    REQUIRE(config->demo.height == 12);
    REQUIRE(config->demo.max_windows == 5);
}

TEST_CASE("Config reads a full layout entry", "[config][policy]")
{
    auto config = parse_config(R"(
[[layouts]]
name = "WideMain"
column_type = "CenterMain"
main_split = "Grid"
stack_split = "Fibonacci"
main_window_count = 2
main_size = 0.65
flipped = "Both"
rotation = "West"
reserve_column_space = "ReserveAndCenter"
balance_stacks = false
)");

    REQUIRE(config.has_value());
    auto const* layout = config->layouts.get("WideMain");
    REQUIRE(layout != nullptr);
    REQUIRE(layout->column_type == ColumnType::CenterMain);
    REQUIRE(layout->main_split == Split::Grid);
    REQUIRE(layout->stack_split == Split::Fibonacci);
    REQUIRE(layout->main_window_count == 2);
    REQUIRE(layout->main_size == Size::of_ratio(0.65));
    REQUIRE(layout->flipped == Flip::Both);
    REQUIRE(layout->rotation == Rotation::West);
    REQUIRE(layout->reserve_column_space == Reserve::ReserveAndCenter);
    REQUIRE_FALSE(layout->balance_stacks);
    REQUIRE(config->layouts.index_of("WideMain") == Layouts().size());
}

TEST_CASE("Config main_size forms", "[config][policy]")
{
    auto config = parse_config(R"(
[[layouts]]
name = "Pixels"
main_size = 400

[[layouts]]
name = "Percent"
main_size = "70%"

[[layouts]]
name = "PixelString"
main_size = "300px"
)");

    REQUIRE(config.has_value());
    REQUIRE(config->layouts.get("Pixels")->main_size == Size::pixel(400));
    REQUIRE(config->layouts.get("Percent")->main_size == Size::of_ratio(0.7));
    REQUIRE(config->layouts.get("PixelString")->main_size == Size::pixel(300));
}

TEST_CASE("Config layout overrides a preset in place", "[config][policy]")
{
    auto config = parse_config(R"(
default_layout = "Grid"

[[layouts]]
name = "Grid"
flipped = "Vertical"
stack_split = "Grid"
column_type = "Stack"
)");

    REQUIRE(config.has_value());
    REQUIRE(config->default_layout == "Grid");
    REQUIRE(config->layouts.size() == Layouts().size());
    REQUIRE(config->layouts.index_of("Grid") == Layouts().index_of("Grid"));
    REQUIRE(config->layouts.get("Grid")->flipped == Flip::Vertical);
}

TEST_CASE("Config keeps defaults for unknown or invalid values", "[config][edge]")
{
    auto config = parse_config(R"(
[[layouts]]
name = "Odd"
column_type = "Spiral"
stack_split = "Zigzag"
main_size = 1.5
main_window_count = -3
)");

    REQUIRE(config.has_value());
    auto const* layout = config->layouts.get("Odd");
    REQUIRE(layout != nullptr);

    LayoutDefinition defaults;
    REQUIRE(layout->column_type == defaults.column_type);
    REQUIRE(layout->stack_split == defaults.stack_split);
    REQUIRE(layout->main_size == defaults.main_size);
    REQUIRE(layout->main_window_count == defaults.main_window_count);
}

TEST_CASE("Config rejects main sizes that do not fit in int32", "[config][edge]")
{
    auto config = parse_config(R"(
[[layouts]]
name = "Wrapped"
main_size = 4294967396

[[layouts]]
name = "Huge"
main_size = "1e12"

[[layouts]]
name = "Infinite"
main_size = "inf"
)");

    REQUIRE(config.has_value());

    LayoutDefinition defaults;
    REQUIRE(config->layouts.get("Wrapped")->main_size == defaults.main_size);
    REQUIRE(config->layouts.get("Huge")->main_size == defaults.main_size);
    REQUIRE(config->layouts.get("Infinite")->main_size == defaults.main_size);
}

TEST_CASE("Config keeps the demo canvas for out-of-range extents", "[config][edge]")
{
    auto config = parse_config(R"(
[demo]
width = 4294967396
height = -4
)");

    REQUIRE(config.has_value());
    REQUIRE(config->demo.width == DemoConfig{}.width);
    REQUIRE(config->demo.height == DemoConfig{}.height);
}

TEST_CASE("Config skips layouts without a name", "[config][edge]")
{
    auto config = parse_config(R"(
[[layouts]]
column_type = "Stack"
)");

    REQUIRE(config.has_value());
    REQUIRE(config->layouts.size() == Layouts().size());
}

TEST_CASE("Config falls back when the default layout is unknown", "[config][edge]")
{
    auto config = parse_config(R"(default_layout = "Missing")");

    REQUIRE(config.has_value());
    REQUIRE(config->default_layout == presets::EVEN_HORIZONTAL);
}

TEST_CASE("Config reads the demo table", "[config][policy]")
{
    auto config = parse_config(R"(
[demo]
width = 80
height = 24
max_windows = 8
)");

    REQUIRE(config.has_value());
    REQUIRE(config->demo.width == 80);
    REQUIRE(config->demo.height == 24);
    REQUIRE(config->demo.max_windows == 8);
}

TEST_CASE("Config rejects malformed TOML", "[config][edge]")
{
    REQUIRE_FALSE(parse_config("[[layouts]\nname = ").has_value());
}

TEST_CASE("Missing config file is reported as nullopt", "[config][edge]")
{
    REQUIRE_FALSE(load_config("/nonexistent/tessel/layouts.toml").has_value());
}
