#include "tessel/geometry/direction.hpp"
#include <catch2/catch_test_macros.hpp>
#include <optional>
#include <vector>

using namespace tessel;

namespace {

constexpr Rect CONTAINER{ 0, 0, 600, 600 };

// +-----+-----+-----+
// |  0  |  3  |  4  |
// +-----+-----+-----+
// |  1  |     |     |
// +-----+  6  |  5  |
// |  2  |     |     |
// +-----+-----+-----+
std::vector<Rect> sample()
{
    return {
        Rect{ 0, 0, 200, 200 },     Rect{ 0, 200, 200, 200 },   Rect{ 0, 400, 200, 200 },
        Rect{ 200, 0, 200, 200 },   Rect{ 400, 0, 200, 200 },   Rect{ 400, 200, 200, 400 },
        Rect{ 200, 200, 200, 400 },
    };
}

std::optional<size_t> neighbor(size_t from, Direction direction)
{
    auto rects = sample();
    return direction_policy::find_neighbor(rects, from, direction, CONTAINER);
}

} // namespace

TEST_CASE("Neighbours to the north", "[direction][policy]")
{
    REQUIRE_FALSE(neighbor(0, Direction::North).has_value());
    REQUIRE(neighbor(1, Direction::North) == 0u);
    REQUIRE(neighbor(2, Direction::North) == 1u);
    REQUIRE_FALSE(neighbor(3, Direction::North).has_value());
    REQUIRE_FALSE(neighbor(4, Direction::North).has_value());
    REQUIRE(neighbor(5, Direction::North) == 4u);
    REQUIRE(neighbor(6, Direction::North) == 3u);
}

TEST_CASE("Neighbours to the east", "[direction][policy]")
{
    REQUIRE(neighbor(0, Direction::East) == 3u);
    REQUIRE(neighbor(1, Direction::East) == 6u);
    REQUIRE(neighbor(2, Direction::East) == 6u);
    REQUIRE(neighbor(3, Direction::East) == 4u);
    REQUIRE_FALSE(neighbor(4, Direction::East).has_value());
    REQUIRE_FALSE(neighbor(5, Direction::East).has_value());
    REQUIRE(neighbor(6, Direction::East) == 5u);
}

TEST_CASE("Neighbours to the south", "[direction][policy]")
{
    REQUIRE(neighbor(0, Direction::South) == 1u);
    REQUIRE(neighbor(1, Direction::South) == 2u);
    REQUIRE_FALSE(neighbor(2, Direction::South).has_value());
    REQUIRE(neighbor(3, Direction::South) == 6u);
    REQUIRE(neighbor(4, Direction::South) == 5u);
    REQUIRE_FALSE(neighbor(5, Direction::South).has_value());
    REQUIRE_FALSE(neighbor(6, Direction::South).has_value());
}

TEST_CASE("Neighbours to the west", "[direction][policy]")
{
    REQUIRE_FALSE(neighbor(0, Direction::West).has_value());
    REQUIRE_FALSE(neighbor(1, Direction::West).has_value());
    REQUIRE_FALSE(neighbor(2, Direction::West).has_value());
    REQUIRE(neighbor(3, Direction::West) == 0u);
    REQUIRE(neighbor(4, Direction::West) == 3u);
    REQUIRE(neighbor(5, Direction::West) == 6u);
    REQUIRE(neighbor(6, Direction::West) == 1u);
}

TEST_CASE("Deck windows are not neighbours of each other", "[direction][edge]")
{
    std::vector<Rect> rects = { { 0, 0, 300, 600 }, { 300, 0, 300, 600 }, { 300, 0, 300, 600 } };

    REQUIRE(direction_policy::find_neighbor(rects, 1, Direction::West, CONTAINER) == 0u);
    REQUIRE_FALSE(direction_policy::find_neighbor(rects, 1, Direction::East, CONTAINER).has_value());
    REQUIRE(direction_policy::find_neighbor(rects, 0, Direction::East, CONTAINER) == 1u);
}

TEST_CASE("Rectangles outside the container are ignored", "[direction][edge]")
{
    std::vector<Rect> rects = { { 0, 0, 300, 600 }, { 700, 0, 300, 600 } };

    REQUIRE_FALSE(direction_policy::find_neighbor(rects, 0, Direction::East, CONTAINER).has_value());
}

TEST_CASE("Out of range index has no neighbour", "[direction][edge]")
{
    auto rects = sample();

    REQUIRE_FALSE(direction_policy::find_neighbor(rects, rects.size(), Direction::North, CONTAINER).has_value());
    REQUIRE_FALSE(direction_policy::find_neighbor(std::vector<Rect>{}, 0, Direction::South, CONTAINER).has_value());
}
