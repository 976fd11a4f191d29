#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tessel {

// ─────────────────────────────────────────────────────────────────────────────
// Basic geometry types
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Axis-aligned rectangle in pixel space.
 *
 * The origin may be negative (workspaces left of or above the primary
 * output), the dimensions may not. A rectangle with a zero dimension is
 * valid and means "no visible space".
 */
struct Rect
{
    int32_t x = 0;
    int32_t y = 0;
    int32_t width = 0;
    int32_t height = 0;

    bool operator==(Rect const&) const = default;
};

struct Point
{
    int32_t x = 0;
    int32_t y = 0;

    bool operator==(Point const&) const = default;
};

/// Thrown when a rectangle with a negative dimension reaches the library.
class InvalidGeometry : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

enum class Axis
{
    Horizontal, ///< Along x: pieces are laid out side by side
    Vertical    ///< Along y: pieces are laid out top to bottom
};

// ─────────────────────────────────────────────────────────────────────────────
// Layout vocabulary
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Top-level arrangement of the columns of a layout.
 *
 * - Stack: one single column, no main
 * - MainAndStack: main column on the left, stack column on the right
 * - CenterMain: first stack, main, second stack from left to right
 */
enum class ColumnType
{
    Stack,
    MainAndStack,
    CenterMain
};

/**
 * @brief How the windows of a column share its rectangle.
 *
 * The names refer to the cuts, not the resulting pieces: Horizontal cuts
 * give rows stacked top to bottom, Vertical cuts give columns side by side.
 */
enum class Split
{
    None,
    Horizontal,
    Vertical,
    Grid,
    Fibonacci,
    Dwindle
};

/// Mirror applied to the whole arrangement. Horizontal mirrors x, Vertical mirrors y.
enum class Flip
{
    None,
    Horizontal,
    Vertical,
    Both
};

/// Rotation applied to the whole arrangement, named after where "up" ends up.
enum class Rotation
{
    North,
    East,
    South,
    West
};

/// What happens to the space of a column that holds no window.
enum class Reserve
{
    None,            ///< Neighbouring columns reclaim the space
    Reserve,         ///< The space stays blank
    ReserveAndCenter ///< The space stays blank and occupied columns are centred
};

enum class Direction
{
    North,
    East,
    South,
    West
};

inline bool is_flipped_horizontal(Flip flip) { return flip == Flip::Horizontal || flip == Flip::Both; }
inline bool is_flipped_vertical(Flip flip) { return flip == Flip::Vertical || flip == Flip::Both; }

inline Flip toggle_horizontal(Flip flip)
{
    switch (flip)
    {
        case Flip::None:
            return Flip::Horizontal;
        case Flip::Horizontal:
            return Flip::None;
        case Flip::Vertical:
            return Flip::Both;
        case Flip::Both:
            return Flip::Vertical;
    }
    return flip;
}

inline Flip toggle_vertical(Flip flip)
{
    switch (flip)
    {
        case Flip::None:
            return Flip::Vertical;
        case Flip::Horizontal:
            return Flip::Both;
        case Flip::Vertical:
            return Flip::None;
        case Flip::Both:
            return Flip::Horizontal;
    }
    return flip;
}

inline Rotation clockwise(Rotation rotation)
{
    switch (rotation)
    {
        case Rotation::North:
            return Rotation::East;
        case Rotation::East:
            return Rotation::South;
        case Rotation::South:
            return Rotation::West;
        case Rotation::West:
            return Rotation::North;
    }
    return rotation;
}

inline Rotation counter_clockwise(Rotation rotation)
{
    switch (rotation)
    {
        case Rotation::North:
            return Rotation::West;
        case Rotation::East:
            return Rotation::North;
        case Rotation::South:
            return Rotation::East;
        case Rotation::West:
            return Rotation::South;
    }
    return rotation;
}

inline bool is_reserved(Reserve reserve) { return reserve != Reserve::None; }

// ─────────────────────────────────────────────────────────────────────────────
// Size
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Extent of the main column, absolute or relative to the workspace width.
 */
struct Size
{
    enum class Kind
    {
        Pixel,
        Ratio
    };

    Kind kind = Kind::Ratio;
    int32_t pixels = 0;
    double ratio = 0.5;

    static Size pixel(int32_t px) { return Size{ Kind::Pixel, std::max<int32_t>(0, px), 0.0 }; }
    static Size of_ratio(double r) { return Size{ Kind::Ratio, 0, std::clamp(r, 0.0, 1.0) }; }

    bool is_pixel() const { return kind == Kind::Pixel; }
    bool is_ratio() const { return kind == Kind::Ratio; }

    /// Resolve against @p whole; ratios are floored.
    int32_t into_absolute(int32_t whole) const;

    bool operator==(Size const&) const = default;
};

// ─────────────────────────────────────────────────────────────────────────────
// Name conversions (used by the config loader and the demo)
// ─────────────────────────────────────────────────────────────────────────────

std::string_view to_string(ColumnType type);
std::string_view to_string(Split split);
std::string_view to_string(Flip flip);
std::string_view to_string(Rotation rotation);
std::string_view to_string(Reserve reserve);
std::string to_string(Size const& size);

std::optional<ColumnType> parse_column_type(std::string_view name);
std::optional<Split> parse_split(std::string_view name);
std::optional<Flip> parse_flip(std::string_view name);
std::optional<Rotation> parse_rotation(std::string_view name);
std::optional<Reserve> parse_reserve(std::string_view name);
std::optional<Size> parse_size(std::string_view text);

} // namespace tessel
