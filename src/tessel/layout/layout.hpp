#pragma once

#include "tessel/core/types.hpp"
#include "tessel/layout/definition.hpp"
#include <vector>

namespace tessel {

namespace layout_policy {

/**
 * @brief Compute one rectangle per window for @p definition inside @p workspace.
 *
 * The result has exactly @p window_count entries in canonical window order:
 * main column windows first, then the first stack, then the second stack
 * (CenterMain), each column in the order its split emits them. The order is
 * taken before flipping and rotating, so the i-th window of the caller's
 * list always maps to the i-th rectangle whatever the transforms.
 *
 * Stateless and deterministic: identical inputs give identical outputs.
 *
 * @throws InvalidGeometry if @p workspace has a negative dimension.
 */
std::vector<Rect> resolve(Rect const& workspace, size_t window_count, LayoutDefinition const& definition);

/// resolve() with the argument order window managers usually have at hand.
inline std::vector<Rect> apply(LayoutDefinition const& definition, size_t window_count, Rect const& workspace)
{
    return resolve(workspace, window_count, definition);
}

} // namespace layout_policy

} // namespace tessel
