// config.h
#pragma once

#include "logger.h"
#include "types.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace fs = std::filesystem;

inline constexpr const char *DEFAULT_HOTKEY = "ctrl+shift+t";

struct FontConfig {
    std::string family = "Sans";
    int size = 16;
};

// Font for a note resized from `base` to `size`: the point size follows the
// area with a damped curve and stays within 10-32pt (or the configured size,
// if that lies outside).
FontConfig scale_font(const FontConfig &font, ui::WindowDimension base,
                      ui::WindowDimension size);

struct Config {
    // Global hotkey, parsed by parse_hotkey()
    std::string hotkey = DEFAULT_HOTKEY;

    // Appearance
    double window_opacity = 0.9;  // (0, 1]
    FontConfig font;

    // Placement of new notes. Without an explicit default_position the first
    // note goes to the top-right corner, inset by placement_margin.
    std::optional<ui::ScreenCoord> default_position;
    int placement_margin = 20;
    int placement_gap = 10;

    LogLevel log_level = LogLevel::INFO;

    // Paths
    static fs::path default_path();
    fs::path config_path;

    static Config load(const fs::path &path);
    static Config parse(const std::multimap<std::string, std::string> &values);
    void save(const fs::path &path) const;
};

std::multimap<std::string, std::string> parse_ini(std::istream &input);
