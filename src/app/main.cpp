#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <tessel/config/config.hpp>
#include <tessel/core/log.hpp>
#include <tessel/geometry/rect.hpp>
#include <tessel/layout/layout.hpp>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct Options
{
    std::string config_path;
    std::string log_file;
    std::string layout;
    size_t max_windows = 0;
    bool verbose = false;
};

std::string default_config_path()
{
    // Try XDG_CONFIG_HOME
    if (char const* xdg = std::getenv("XDG_CONFIG_HOME"))
    {
        return std::string(xdg) + "/tessel/layouts.toml";
    }

    // Fall back to ~/.config
    if (char const* home = std::getenv("HOME"))
    {
        return std::string(home) + "/.config/tessel/layouts.toml";
    }

    return "";
}

Options parse_options(int argc, char* argv[])
{
    Options options;
    options.config_path = default_config_path();

    std::vector<std::string_view> positional;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "--config" && i + 1 < argc)
            options.config_path = argv[++i];
        else if (arg == "--log-file" && i + 1 < argc)
            options.log_file = argv[++i];
        else if (arg == "-v" || arg == "--verbose")
            options.verbose = true;
        else
            positional.push_back(arg);
    }

    if (!positional.empty())
        options.layout = std::string(positional[0]);
    if (positional.size() > 1)
        options.max_windows = static_cast<size_t>(std::stoul(std::string(positional[1])));

    return options;
}

void draw_line(std::vector<std::string>& canvas, int32_t x0, int32_t y0, int32_t x1, int32_t y1)
{
    for (int32_t y = y0; y <= y1; ++y)
    {
        for (int32_t x = x0; x <= x1; ++x)
        {
            char& cell = canvas[static_cast<size_t>(y)][static_cast<size_t>(x)];
            bool const corner = (x == x0 && y == y0) || (x == x1 && y == y1);
            if (corner || cell == '+' || (cell == '-' && x0 == x1) || (cell == '|' && y0 == y1))
                cell = '+';
            else
                cell = (x0 == x1) ? '|' : '-';
        }
    }
}

// One box per window, numbered in canonical window order.
std::string draw(tessel::LayoutDefinition const& layout, size_t windows, int32_t width, int32_t height)
{
    tessel::Rect const workspace = tessel::make_rect(0, 0, width, height);
    auto tiles = tessel::layout_policy::resolve(workspace, windows, layout);

    std::vector<std::string> canvas(static_cast<size_t>(height) + 1, std::string(static_cast<size_t>(width) + 1, ' '));
    draw_line(canvas, 0, 0, width, 0);
    draw_line(canvas, 0, height, width, height);
    draw_line(canvas, 0, 0, 0, height);
    draw_line(canvas, width, 0, width, height);

    for (size_t i = 0; i < tiles.size(); ++i)
    {
        auto const& tile = tiles[i];
        int32_t const x1 = tile.x + tile.width;
        int32_t const y1 = tile.y + tile.height;
        draw_line(canvas, tile.x, tile.y, x1, tile.y);
        draw_line(canvas, tile.x, y1, x1, y1);
        draw_line(canvas, tile.x, tile.y, tile.x, y1);
        draw_line(canvas, x1, tile.y, x1, y1);

        std::string label = std::to_string(i + 1);
        if (tile.width > static_cast<int32_t>(label.size()) && tile.height > 1)
            canvas[static_cast<size_t>(tile.y) + 1].replace(static_cast<size_t>(tile.x) + 1, label.size(), label);
    }

    std::string out;
    for (auto const& row : canvas)
        out += row + '\n';
    return out;
}

void list_layouts(tessel::Config const& config)
{
    for (auto const& layout : config.layouts.all())
    {
        std::cout << (layout.name == config.default_layout ? "* " : "  ") << layout.name << " ("
                  << tessel::to_string(layout.column_type) << ", main " << tessel::to_string(layout.main_split)
                  << ", stack " << tessel::to_string(layout.stack_split) << ")\n";
    }
}

} // namespace

int main(int argc, char* argv[])
{
    Options options;
    try
    {
        options = parse_options(argc, argv);
    }
    catch (std::exception const&)
    {
        std::cerr << "Usage: tessel-demo [--config FILE] [--log-file FILE] [-v] [LAYOUT] [MAX_WINDOWS]\n";
        return 2;
    }

    tessel::log::init(options.verbose ? spdlog::level::trace : spdlog::level::warn, options.log_file);

    try
    {
        tessel::Config config;

        if (!options.config_path.empty() && fs::exists(options.config_path))
        {
            LOG_INFO("Loading layouts from: {}", options.config_path);
            auto loaded = tessel::load_config(options.config_path);
            if (loaded)
            {
                config = *loaded;
            }
            else
            {
                LOG_WARN("Failed to load config, using built-in layouts");
                config = tessel::default_config();
            }
        }
        else
        {
            LOG_INFO("No config file found, using built-in layouts");
            config = tessel::default_config();
        }

        if (options.layout.empty())
        {
            list_layouts(config);
            tessel::log::shutdown();
            return 0;
        }

        std::string const& name = options.layout;
        auto const* layout = config.layouts.get(name);
        if (!layout)
        {
            LOG_ERROR("Unknown layout '{}'", name);
            list_layouts(config);
            tessel::log::shutdown();
            return 1;
        }

        size_t const max_windows = options.max_windows > 0 ? options.max_windows : config.demo.max_windows;
        for (size_t windows = 1; windows <= max_windows; ++windows)
        {
            std::cout << name << " - " << windows << " window" << (windows == 1 ? "" : "s") << '\n';
            std::cout << draw(*layout, windows, config.demo.width, config.demo.height) << '\n';
        }
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Error: {}", e.what());
        tessel::log::shutdown();
        return 1;
    }

    tessel::log::shutdown();
    return 0;
}
