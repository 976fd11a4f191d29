#include "config.hpp"
#include "tessel/core/log.hpp"
#include <limits>
#include <toml++/toml.hpp>
#include <utility>

namespace tessel {

namespace {

template<typename Enum, typename Parser>
void read_enum(toml::table const& tbl, std::string_view key, std::string const& layout, Enum& out, Parser parse)
{
    auto v = tbl[key].value<std::string>();
    if (!v)
        return;

    if (auto parsed = parse(*v))
        out = *parsed;
    else
        LOG_WARN("Layout {}: unknown {} '{}', keeping {}", layout, key, *v, to_string(out));
}

std::optional<Size> read_size(toml::node_view<toml::node const> node)
{
    if (node.is_integer())
    {
        auto px = node.value<int64_t>();
        if (px && *px >= 0 && *px <= std::numeric_limits<int32_t>::max())
            return Size::pixel(static_cast<int32_t>(*px));
        return std::nullopt;
    }
    if (node.is_floating_point())
    {
        auto ratio = node.value<double>();
        if (ratio && *ratio >= 0.0 && *ratio <= 1.0)
            return Size::of_ratio(*ratio);
        return std::nullopt;
    }
    if (auto text = node.value<std::string>())
        return parse_size(*text);
    return std::nullopt;
}

// Demo canvas extents stay within [0, INT32_MAX]; anything else keeps the default.
void read_extent(toml::table const& tbl, std::string_view key, int32_t& out)
{
    auto v = tbl[key].value<int64_t>();
    if (!v)
        return;

    if (*v >= 0 && *v <= std::numeric_limits<int32_t>::max())
        out = static_cast<int32_t>(*v);
    else
        LOG_WARN("Demo {} {} out of range, keeping {}", key, *v, out);
}

std::optional<LayoutDefinition> read_layout(toml::table const& tbl)
{
    auto name = tbl["name"].value<std::string>();
    if (!name || name->empty())
    {
        LOG_WARN("Skipping layout without a name");
        return std::nullopt;
    }

    LayoutDefinition layout;
    layout.name = *name;

    read_enum(tbl, "column_type", layout.name, layout.column_type, parse_column_type);
    read_enum(tbl, "main_split", layout.name, layout.main_split, parse_split);
    read_enum(tbl, "stack_split", layout.name, layout.stack_split, parse_split);
    read_enum(tbl, "flipped", layout.name, layout.flipped, parse_flip);
    read_enum(tbl, "rotation", layout.name, layout.rotation, parse_rotation);
    read_enum(tbl, "reserve_column_space", layout.name, layout.reserve_column_space, parse_reserve);

    if (auto v = tbl["main_window_count"].value<int64_t>())
    {
        if (*v >= 0)
            layout.main_window_count = static_cast<size_t>(*v);
        else
            LOG_WARN("Layout {}: negative main_window_count {}, keeping {}", layout.name, *v, layout.main_window_count);
    }

    if (tbl.contains("main_size"))
    {
        if (auto size = read_size(tbl["main_size"]))
            layout.main_size = *size;
        else
            LOG_WARN("Layout {}: invalid main_size, keeping {}", layout.name, to_string(layout.main_size));
    }

    if (auto v = tbl["balance_stacks"].value<bool>())
        layout.balance_stacks = *v;

    return layout;
}

Config read_config(toml::table const& tbl)
{
    Config cfg = default_config();

    if (auto v = tbl["default_layout"].value<std::string>())
        cfg.default_layout = *v;

    // Demo
    if (auto demo = tbl["demo"].as_table())
    {
        read_extent(*demo, "width", cfg.demo.width);
        read_extent(*demo, "height", cfg.demo.height);
        if (auto v = (*demo)["max_windows"].value<int64_t>())
            cfg.demo.max_windows = static_cast<size_t>(std::max<int64_t>(0, *v));
    }

    // Layouts
    if (auto layouts = tbl["layouts"].as_array())
    {
        for (auto const& item : *layouts)
        {
            if (auto layout_tbl = item.as_table())
            {
                if (auto layout = read_layout(*layout_tbl))
                    cfg.layouts.append_or_overwrite(std::move(*layout));
            }
        }
    }

    if (!cfg.layouts.get(cfg.default_layout))
    {
        LOG_WARN("Default layout '{}' does not exist, using {}", cfg.default_layout, cfg.layouts[0].name);
        cfg.default_layout = cfg.layouts[0].name;
    }

    LOG_INFO("Loaded {} layouts", cfg.layouts.size());
    return cfg;
}

} // namespace

Config default_config()
{
    Config cfg;
    cfg.default_layout = std::string(presets::MAIN_AND_VERT_STACK);
    cfg.demo = DemoConfig{};
    cfg.layouts = Layouts();
    return cfg;
}

std::optional<Config> load_config(std::string const& path)
{
    try
    {
        auto tbl = toml::parse_file(path);
        return read_config(tbl);
    }
    catch (toml::parse_error const& err)
    {
        LOG_ERROR("Config parse error in {}: {}", path, err.description());
        return std::nullopt;
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Config error: {}", e.what());
        return std::nullopt;
    }
}

std::optional<Config> parse_config(std::string_view text)
{
    try
    {
        auto tbl = toml::parse(text);
        return read_config(tbl);
    }
    catch (toml::parse_error const& err)
    {
        LOG_ERROR("Config parse error: {}", err.description());
        return std::nullopt;
    }
}

} // namespace tessel
