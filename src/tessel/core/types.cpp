#include "types.hpp"
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <utility>

namespace tessel {

namespace {

// Keeps 0.29 * 100 from flooring to 28.
constexpr double RATIO_EPSILON = 1e-9;

template<typename Enum, size_t N>
std::optional<Enum> lookup(std::array<std::pair<std::string_view, Enum>, N> const& table, std::string_view name)
{
    for (auto const& [key, value] : table)
    {
        if (key.size() != name.size())
            continue;

        bool same = true;
        for (size_t i = 0; i < key.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(key[i])) != std::tolower(static_cast<unsigned char>(name[i])))
            {
                same = false;
                break;
            }
        }
        if (same)
            return value;
    }
    return std::nullopt;
}

constexpr std::array<std::pair<std::string_view, ColumnType>, 3> COLUMN_TYPES = { {
    { "Stack", ColumnType::Stack },
    { "MainAndStack", ColumnType::MainAndStack },
    { "CenterMain", ColumnType::CenterMain },
} };

constexpr std::array<std::pair<std::string_view, Split>, 6> SPLITS = { {
    { "None", Split::None },
    { "Horizontal", Split::Horizontal },
    { "Vertical", Split::Vertical },
    { "Grid", Split::Grid },
    { "Fibonacci", Split::Fibonacci },
    { "Dwindle", Split::Dwindle },
} };

constexpr std::array<std::pair<std::string_view, Flip>, 4> FLIPS = { {
    { "None", Flip::None },
    { "Horizontal", Flip::Horizontal },
    { "Vertical", Flip::Vertical },
    { "Both", Flip::Both },
} };

constexpr std::array<std::pair<std::string_view, Rotation>, 4> ROTATIONS = { {
    { "North", Rotation::North },
    { "East", Rotation::East },
    { "South", Rotation::South },
    { "West", Rotation::West },
} };

constexpr std::array<std::pair<std::string_view, Reserve>, 3> RESERVES = { {
    { "None", Reserve::None },
    { "Reserve", Reserve::Reserve },
    { "ReserveAndCenter", Reserve::ReserveAndCenter },
} };

template<typename Enum, size_t N>
std::string_view name_of(std::array<std::pair<std::string_view, Enum>, N> const& table, Enum value)
{
    for (auto const& [key, entry] : table)
    {
        if (entry == value)
            return key;
    }
    return "Unknown";
}

std::string_view trim(std::string_view text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

std::optional<double> parse_number(std::string_view text)
{
    std::string copy(text);
    if (copy.empty())
        return std::nullopt;
    try
    {
        size_t consumed = 0;
        double value = std::stod(copy, &consumed);
        if (consumed != copy.size())
            return std::nullopt;
        return value;
    }
    catch (std::exception const&)
    {
        return std::nullopt;
    }
}

} // namespace

int32_t Size::into_absolute(int32_t whole) const
{
    switch (kind)
    {
        case Kind::Pixel:
            return pixels;
        case Kind::Ratio:
            return static_cast<int32_t>(std::floor(static_cast<double>(whole) * ratio + RATIO_EPSILON));
    }
    return 0;
}

std::string_view to_string(ColumnType type) { return name_of(COLUMN_TYPES, type); }
std::string_view to_string(Split split) { return name_of(SPLITS, split); }
std::string_view to_string(Flip flip) { return name_of(FLIPS, flip); }
std::string_view to_string(Rotation rotation) { return name_of(ROTATIONS, rotation); }
std::string_view to_string(Reserve reserve) { return name_of(RESERVES, reserve); }

std::string to_string(Size const& size)
{
    if (size.is_pixel())
        return std::to_string(size.pixels) + "px";

    long percent = std::lround(size.ratio * 100.0);
    return std::to_string(percent) + "%";
}

std::optional<ColumnType> parse_column_type(std::string_view name) { return lookup(COLUMN_TYPES, trim(name)); }
std::optional<Split> parse_split(std::string_view name) { return lookup(SPLITS, trim(name)); }
std::optional<Flip> parse_flip(std::string_view name) { return lookup(FLIPS, trim(name)); }
std::optional<Rotation> parse_rotation(std::string_view name) { return lookup(ROTATIONS, trim(name)); }
std::optional<Reserve> parse_reserve(std::string_view name) { return lookup(RESERVES, trim(name)); }

std::optional<Size> parse_size(std::string_view text)
{
    text = trim(text);
    if (text.empty())
        return std::nullopt;

    if (text.ends_with("px"))
    {
        std::string_view digits = trim(text.substr(0, text.size() - 2));
        int32_t px = 0;
        auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), px);
        if (ec != std::errc{} || end != digits.data() + digits.size() || px < 0)
            return std::nullopt;
        return Size::pixel(px);
    }

    if (text.ends_with('%'))
    {
        auto percent = parse_number(trim(text.substr(0, text.size() - 1)));
        if (!percent || !std::isfinite(*percent) || *percent < 0.0 || *percent > 100.0)
            return std::nullopt;
        return Size::of_ratio(*percent / 100.0);
    }

    auto value = parse_number(text);
    if (!value || !std::isfinite(*value) || *value < 0.0)
        return std::nullopt;
    if (*value <= 1.0)
        return Size::of_ratio(*value);
    if (*value != std::floor(*value) || *value > static_cast<double>(std::numeric_limits<int32_t>::max()))
        return std::nullopt;
    return Size::pixel(static_cast<int32_t>(*value));
}

} // namespace tessel
