#include "config.hpp"

#include "util.hpp"

#include <string>
#include <vector>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>


namespace {

GridSize parse_grid_pair(const nlohmann::json& j) {
    if (!j.is_array() || j.size() != 2) {
        throw std::runtime_error("Grid size must be a [rows, cols] pair: " + j.dump());
    }

    GridSize grid{j.at(0).get<int>(), j.at(1).get<int>()};
    if (!grid.valid()) {
        throw std::runtime_error("Grid size must be positive: " + j.dump());
    }
    return grid;
}

}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        return Config{};
    }

    nlohmann::json j;
    try {
        f >> j;
    }
    catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }
    return from_json(j);
}

Config Config::from_json(const nlohmann::json& j) {
    Config config;

    try {
        if (j.contains("window")) {
            const auto& w = j.at("window");
            config.window.width = w.value("width", config.window.width);
            config.window.height = w.value("height", config.window.height);
        }

        config.snap_threshold = j.value("snap_threshold", config.snap_threshold);
        config.seconds_per_piece = j.value("seconds_per_piece", config.seconds_per_piece);
        config.moves_per_piece = j.value("moves_per_piece", config.moves_per_piece);

        if (j.contains("layout")) {
            const auto& l = j.at("layout");
            config.layout.play_width_ratio = l.value("play_width_ratio", config.layout.play_width_ratio);
            config.layout.side_width_ratio = l.value("side_width_ratio", config.layout.side_width_ratio);
            config.layout.staging_height_ratio = l.value("staging_height_ratio", config.layout.staging_height_ratio);
            config.layout.margin = l.value("margin", config.layout.margin);
            config.layout.preview_max_size = l.value("preview_max_size", config.layout.preview_max_size);
        }

        if (j.contains("grid_options")) {
            config.grid_options.clear();
            for (const auto& entry : j.at("grid_options")) {
                config.grid_options.push_back(parse_grid_pair(entry));
            }
        }

        if (j.contains("default_grid")) {
            config.default_grid = parse_grid_pair(j.at("default_grid"));
        }

        if (j.contains("default_mode")) {
            std::string name = j.at("default_mode").get<std::string>();
            auto mode = Util::parse_mode(name);
            if (!mode) {
                throw std::runtime_error("Unknown game mode: " + name);
            }
            config.default_mode = *mode;
        }

        config.font = j.value("font", config.font);
        config.stock_images_dir = j.value("stock_images_dir", config.stock_images_dir);

        if (j.contains("catalog")) {
            const auto& c = j.at("catalog");
            config.catalog_meta = c.value("meta", config.catalog_meta);
            config.catalog_data = c.value("data", config.catalog_data);
        }
    }
    catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    if (config.window.width <= 0 || config.window.height <= 0) {
        throw std::runtime_error("Window size must be positive");
    }
    if (config.grid_options.empty()) {
        throw std::runtime_error("At least one grid option is required");
    }
    if (config.snap_threshold <= 0.0) {
        throw std::runtime_error("Snap threshold must be positive");
    }
    if (config.seconds_per_piece <= 0 || config.moves_per_piece <= 0) {
        throw std::runtime_error("Per-piece time and move allowances must be positive");
    }

    const LayoutConfig& l = config.layout;
    for (double ratio : {l.play_width_ratio, l.side_width_ratio, l.staging_height_ratio}) {
        if (ratio <= 0.0 || ratio > 1.0) {
            throw std::runtime_error("Layout ratios must lie in (0, 1]: " + std::to_string(ratio));
        }
    }
    if (l.margin < 0 || l.preview_max_size < 0) {
        throw std::runtime_error("Layout margin and preview size must not be negative");
    }
    return config;
}
