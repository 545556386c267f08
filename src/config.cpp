// config.cpp
#include "config.h"
#include "logger.h"
#include "utility.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <istream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace
{

std::optional<std::string>
get_last(const std::multimap<std::string, std::string> &map,
         const std::string &key)
{
    auto range = map.equal_range(key);
    if (range.first == range.second)
        return std::nullopt;

    auto last = std::prev(range.second);
    return last->second;
}

std::optional<int> get_int(const std::multimap<std::string, std::string> &map,
                           const std::string &key)
{
    auto value = get_last(map, key);
    if (!value)
        return std::nullopt;

    try {
        return std::stoi(*value);
    } catch (const std::logic_error &) {
        LOG_WARNING("Ignoring invalid integer for %s: '%s'", key.c_str(),
                    value->c_str());
        return std::nullopt;
    }
}

int get_int_or(const std::multimap<std::string, std::string> &map,
               const std::string &key, int default_value)
{
    return get_int(map, key).value_or(default_value);
}

std::string get_string_or(const std::multimap<std::string, std::string> &map,
                          const std::string &key, std::string default_value)
{
    auto value = get_last(map, key);
    return value && !value->empty() ? *value : default_value;
}

double get_double_or(const std::multimap<std::string, std::string> &map,
                     const std::string &key, double default_value)
{
    auto value = get_last(map, key);
    if (!value)
        return default_value;

    try {
        return std::stod(*value);
    } catch (const std::logic_error &) {
        LOG_WARNING("Ignoring invalid number for %s: '%s'", key.c_str(),
                    value->c_str());
        return default_value;
    }
}

std::string level_name(LogLevel level)
{
    switch (level) {
    case LogLevel::DEBUG:
        return "debug";
    case LogLevel::INFO:
        return "info";
    case LogLevel::WARNING:
        return "warning";
    case LogLevel::ERR:
        return "error";
    }
    return "info";
}

} // namespace

FontConfig scale_font(const FontConfig &font, ui::WindowDimension base,
                      ui::WindowDimension size)
{
    constexpr int MIN_SCALED_SIZE = 10;
    constexpr int MAX_SCALED_SIZE = 32;
    constexpr double DAMPING = 0.3;

    const double base_area = static_cast<double>(base.width) * base.height;
    if (base_area <= 0.0) {
        return font;
    }
    const double area = static_cast<double>(size.width) * size.height;
    const int scaled =
        static_cast<int>(font.size * std::pow(area / base_area, DAMPING));

    FontConfig result = font;
    result.size = std::clamp(scaled, std::min(MIN_SCALED_SIZE, font.size),
                             std::max(MAX_SCALED_SIZE, font.size));
    return result;
}

std::multimap<std::string, std::string> parse_ini(std::istream &input)
{
    std::multimap<std::string, std::string> result;
    std::string line;

    while (std::getline(input, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            result.emplace(trim(line.substr(0, pos)),
                           trim(line.substr(pos + 1)));
        }
    }
    return result;
}

fs::path Config::default_path()
{
    const auto home = platform::get_home_dir();
    if (!home)
        return {};
    return *home / ".floatnote" / "config.ini";
}

Config Config::parse(const std::multimap<std::string, std::string> &map)
{
    Config cfg;

    cfg.hotkey = get_string_or(map, "hotkey", cfg.hotkey);

    cfg.window_opacity =
        get_double_or(map, "window_opacity", cfg.window_opacity);
    if (!(cfg.window_opacity > 0.0) || cfg.window_opacity > 1.0) {
        const double clamped = cfg.window_opacity > 1.0 ? 1.0 : 0.1;
        LOG_WARNING("window_opacity %f outside (0, 1], using %.1f",
                    cfg.window_opacity, clamped);
        cfg.window_opacity = clamped;
    }

    cfg.font.family = get_string_or(map, "font.family", cfg.font.family);
    cfg.font.size = get_int_or(map, "font.size", cfg.font.size);
    if (cfg.font.size <= 0) {
        LOG_WARNING("font.size %d is not positive, using 16", cfg.font.size);
        cfg.font.size = 16;
    }

    const auto anchor_x = get_int(map, "default_position.x");
    const auto anchor_y = get_int(map, "default_position.y");
    if (anchor_x && anchor_y) {
        cfg.default_position = ui::ScreenCoord{*anchor_x, *anchor_y};
    } else if (anchor_x || anchor_y) {
        LOG_WARNING("default_position needs both x and y, using top-right "
                    "anchor");
    }

    cfg.placement_margin =
        std::max(0, get_int_or(map, "placement.margin", cfg.placement_margin));
    cfg.placement_gap =
        std::max(0, get_int_or(map, "placement.gap", cfg.placement_gap));

    if (auto level_value = get_last(map, "log_level")) {
        if (auto level = parse_log_level(*level_value)) {
            cfg.log_level = *level;
        } else {
            LOG_WARNING("Unknown log_level '%s'", level_value->c_str());
        }
    }

    return cfg;
}

Config Config::load(const fs::path &path)
{
    if (!fs::exists(path)) {
        Config cfg;
        cfg.config_path = path;
        fs::create_directories(path.parent_path());
        cfg.save(path);
        return cfg;
    }

    std::ifstream file(path);
    if (!file) {
        LOG_WARNING("Cannot read %s, using defaults", path.c_str());
        Config cfg;
        cfg.config_path = path;
        return cfg;
    }

    Config cfg = parse(parse_ini(file));
    cfg.config_path = path;
    return cfg;
}

void Config::save(const fs::path &path) const
{
    std::ofstream file(path);
    if (!file) {
        LOG_WARNING("Cannot write config to %s", path.c_str());
        return;
    }

    file << "# floatnote configuration\n";
    file << "# This file is auto-generated with defaults on first run.\n";
    file << "\n";

    file << "# Global hotkey that opens the input prompt\n";
    file << "hotkey=" << hotkey << "\n";
    file << "\n";

    file << "# Appearance\n";
    file << "window_opacity=" << window_opacity << "\n";
    file << "font.family=" << font.family << "\n";
    file << "font.size=" << font.size << "\n";
    file << "\n";

    file << "# Placement (pixels). Uncomment default_position to replace the\n";
    file << "# top-right anchor.\n";
    if (default_position) {
        file << "default_position.x=" << default_position->x << "\n";
        file << "default_position.y=" << default_position->y << "\n";
    } else {
        file << "#default_position.x=100\n";
        file << "#default_position.y=100\n";
    }
    file << "placement.margin=" << placement_margin << "\n";
    file << "placement.gap=" << placement_gap << "\n";
    file << "\n";

    file << "# debug, info, warning or error\n";
    file << "log_level=" << level_name(log_level) << "\n";
}
