#pragma once

#include "main.hpp"

#include <opencv2/opencv.hpp>

struct LayoutConfig {
    double play_width_ratio = 0.65;
    double side_width_ratio = 0.30;
    double staging_height_ratio = 0.50;
    int margin = 20;
    int preview_max_size = 200;
};

// Picture browser page: one image between the page buttons, its details underneath
struct MenuLayout {
    cv::Size window;
    cv::Rect image_box;
    cv::Rect image;
    cv::Rect prev_button;
    cv::Rect next_button;
    int page_label_y = 0;
    int info_y = 0;
};

class Layout {
public:
    static ScreenLayout compute_layout(const cv::Size& screen, const LayoutConfig& config);
    static MenuLayout compute_menu_layout(const cv::Size& window, const cv::Size& image);

    // Largest rect with the aspect of content that fits box, centered in it
    static cv::Rect fit_inside(const cv::Size& content, const cv::Rect& box);

    static cv::Size piece_size(const cv::Rect& play_area, GridSize grid);
    static cv::Point cell_target_position(const cv::Rect& play_area, GridSize grid, GridCell cell);
};
