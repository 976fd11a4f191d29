#include "tessel/core/types.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace tessel;

TEST_CASE("Ratio sizes resolve against the whole and floor", "[types][size]")
{
    REQUIRE(Size::of_ratio(0.6).into_absolute(1000) == 600);
    REQUIRE(Size::of_ratio(0.5).into_absolute(33) == 16);
    REQUIRE(Size::of_ratio(0.29).into_absolute(100) == 29);
    REQUIRE(Size::of_ratio(0.65).into_absolute(5120) == 3328);
}

TEST_CASE("Pixel sizes ignore the whole", "[types][size]")
{
    REQUIRE(Size::pixel(400).into_absolute(1000) == 400);
    REQUIRE(Size::pixel(400).into_absolute(100) == 400);
}

TEST_CASE("Size factories clamp their input", "[types][size][edge]")
{
    REQUIRE(Size::pixel(-20).pixels == 0);
    REQUIRE(Size::of_ratio(1.5).ratio == 1.0);
    REQUIRE(Size::of_ratio(-0.5).ratio == 0.0);
}

TEST_CASE("parse_size accepts pixels, percentages and bare numbers", "[types][parse]")
{
    REQUIRE(parse_size("400px") == Size::pixel(400));
    REQUIRE(parse_size(" 400 px ") == Size::pixel(400));
    REQUIRE(parse_size("65%") == Size::of_ratio(0.65));
    REQUIRE(parse_size("0.5") == Size::of_ratio(0.5));
    REQUIRE(parse_size("1") == Size::of_ratio(1.0));
    REQUIRE(parse_size("300") == Size::pixel(300));
}

TEST_CASE("parse_size rejects malformed input", "[types][parse][edge]")
{
    REQUIRE_FALSE(parse_size("").has_value());
    REQUIRE_FALSE(parse_size("abc").has_value());
    REQUIRE_FALSE(parse_size("-5px").has_value());
    REQUIRE_FALSE(parse_size("120%").has_value());
    REQUIRE_FALSE(parse_size("12.5").has_value());
    REQUIRE_FALSE(parse_size("10pxx").has_value());
}

TEST_CASE("Size names round-trip through to_string", "[types][parse]")
{
    REQUIRE(to_string(Size::pixel(400)) == "400px");
    REQUIRE(to_string(Size::of_ratio(0.65)) == "65%");
}

TEST_CASE("Enum names parse case-insensitively", "[types][parse]")
{
    REQUIRE(parse_column_type("centermain") == ColumnType::CenterMain);
    REQUIRE(parse_split("FIBONACCI") == Split::Fibonacci);
    REQUIRE(parse_flip("Both") == Flip::Both);
    REQUIRE(parse_rotation(" west ") == Rotation::West);
    REQUIRE(parse_reserve("ReserveAndCenter") == Reserve::ReserveAndCenter);

    REQUIRE_FALSE(parse_split("Spiral").has_value());
    REQUIRE_FALSE(parse_column_type("").has_value());
}

TEST_CASE("Enum names match their parsers", "[types][parse]")
{
    for (auto split : { Split::None, Split::Horizontal, Split::Vertical, Split::Grid, Split::Fibonacci, Split::Dwindle })
    {
        REQUIRE(parse_split(to_string(split)) == split);
    }
    for (auto type : { ColumnType::Stack, ColumnType::MainAndStack, ColumnType::CenterMain })
    {
        REQUIRE(parse_column_type(to_string(type)) == type);
    }
}

TEST_CASE("Flip toggles compose per axis", "[types][flip]")
{
    REQUIRE(toggle_horizontal(Flip::None) == Flip::Horizontal);
    REQUIRE(toggle_horizontal(Flip::Vertical) == Flip::Both);
    REQUIRE(toggle_vertical(Flip::Both) == Flip::Horizontal);
    REQUIRE(toggle_vertical(toggle_vertical(Flip::Horizontal)) == Flip::Horizontal);
}

TEST_CASE("Rotations cycle in both directions", "[types][rotation]")
{
    REQUIRE(clockwise(Rotation::North) == Rotation::East);
    REQUIRE(clockwise(Rotation::West) == Rotation::North);
    REQUIRE(counter_clockwise(Rotation::North) == Rotation::West);
    REQUIRE(counter_clockwise(clockwise(Rotation::South)) == Rotation::South);
}

TEST_CASE("parse_size rejects pixel values outside int32 and non-finite numbers", "[types][parse][edge]")
{
    REQUIRE_FALSE(parse_size("1e12").has_value());
    REQUIRE_FALSE(parse_size("4294967396").has_value());
    REQUIRE_FALSE(parse_size("inf").has_value());
    REQUIRE_FALSE(parse_size("nan").has_value());
    REQUIRE_FALSE(parse_size("inf%").has_value());
    REQUIRE_FALSE(parse_size("nan%").has_value());
    REQUIRE_FALSE(parse_size("99999999999px").has_value());

    REQUIRE(parse_size("2147483647") == Size::pixel(2147483647));
}
