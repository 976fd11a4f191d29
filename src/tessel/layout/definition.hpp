#pragma once

#include "tessel/core/types.hpp"
#include <optional>
#include <string>

namespace tessel {

/// Step used by increase_main_size()/decrease_main_size() for pixel sizes.
constexpr int32_t MAIN_SIZE_PIXEL_STEP = 50;
/// Step used by increase_main_size()/decrease_main_size() for ratio sizes.
constexpr double MAIN_SIZE_RATIO_STEP = 0.05;

/**
 * @brief Fully resolved description of a layout.
 *
 * This is the only input the resolver needs besides the workspace and the
 * window count. A window manager typically holds one per workspace as the
 * "current layout" and mutates it between resolves through the accessors
 * below; those mutators are not synchronized.
 */
struct LayoutDefinition
{
    std::string name = "MainAndStack";
    ColumnType column_type = ColumnType::MainAndStack;

    /// Split of the main column. Split::None caps the main column at one window.
    Split main_split = Split::Vertical;
    /// Split of the stack column(s). Split::None stacks the windows as a deck.
    Split stack_split = Split::Horizontal;

    /// Target number of windows in the main column; 0 disables it.
    size_t main_window_count = 1;
    Size main_size = Size::of_ratio(0.5);

    Flip flipped = Flip::None;
    Rotation rotation = Rotation::North;
    Reserve reserve_column_space = Reserve::None;

    /**
     * @brief Spread stack windows over both stacks of a CenterMain layout.
     *
     * true: split as evenly as possible, the first (left) stack taking the
     * extra window. false: every stack window goes to the first stack.
     *
     * ```
     * +-----+-------+-----+
     * |  2  |       |  4  |
     * |-----|   1   |-----|
     * |  3  |       |  5  |
     * +-----+-------+-----+
     * ```
     */
    bool balance_stacks = true;

    bool operator==(LayoutDefinition const&) const = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Accessors
    // ─────────────────────────────────────────────────────────────────────────

    bool has_main() const { return column_type != ColumnType::Stack; }

    /// Current main window count, nullopt for single-column layouts.
    std::optional<size_t> get_main_window_count() const;

    /// Current main size, nullopt for single-column layouts.
    std::optional<Size> get_main_size() const;

    /// Replace the main size, clamped to pixels >= 0 or a ratio within [0, 1].
    void set_main_size(Size size);

    /**
     * @brief Grow or shrink the main column by @p delta, clamped to [0, upper_bound].
     *
     * Pixel sizes take @p delta and @p upper_bound in pixels, ratio sizes in
     * percentage points of the workspace width.
     */
    void change_main_size(int32_t delta, int32_t upper_bound);

    void increase_main_size(int32_t upper_bound);
    void decrease_main_size();

    void set_main_window_count(size_t count);
    void increase_main_window_count();
    void decrease_main_window_count();

    void rotate(bool clockwise_turn);
    void toggle_flip_horizontal();
    void toggle_flip_vertical();

    /// One window visible at a time, full workspace.
    bool is_monocle() const;
    /// One main window beside a deck of stack windows.
    bool is_main_and_deck() const;
};

} // namespace tessel
