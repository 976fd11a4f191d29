#pragma once

#include "tessel/config/presets.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tessel {

struct DemoConfig
{
    int32_t width = 42;
    int32_t height = 12;
    size_t max_windows = 5;
};

struct Config
{
    std::string default_layout = std::string(presets::MAIN_AND_VERT_STACK);
    DemoConfig demo;
    Layouts layouts;
};

/**
 * @brief Load a TOML layout file on top of the built-in presets.
 *
 * Layouts from the file whose name matches a preset replace it in place,
 * the others are appended. Missing keys keep their defaults; unknown values
 * are logged and ignored. Returns nullopt if the file cannot be parsed.
 */
std::optional<Config> load_config(std::string const& path);

/// Same as load_config() for an in-memory document.
std::optional<Config> parse_config(std::string_view text);

Config default_config();

} // namespace tessel
