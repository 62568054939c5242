#pragma once

#include "main.hpp"
#include "layout.hpp"
#include "interaction.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <opencv2/opencv.hpp>


struct Config {
    cv::Size window{1400, 900};

    double snap_threshold = DEFAULT_SNAP_THRESHOLD;
    int seconds_per_piece = 30;
    int moves_per_piece = 3;

    LayoutConfig layout;

    std::vector<GridSize> grid_options{{2, 3}, {3, 3}, {3, 4}, {4, 4}, {4, 5}, {5, 5}};
    GridSize default_grid{3, 3};
    GameMode default_mode = GameMode::Free;

    std::string font = FONT_FILE;
    std::string catalog_meta = PUZZLE_META_FILE;
    std::string catalog_data = PUZZLE_DATA_FILE;
    std::string stock_images_dir = STOCK_IMAGES_DIR;

public:
    // Missing file yields the defaults; malformed content throws
    static Config load(const std::string& path);
    static Config from_json(const nlohmann::json& j);
};
