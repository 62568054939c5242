#include "layout.hpp"

#include "slicer.hpp"

#include <algorithm>

#include <opencv2/opencv.hpp>


// Play area on the left, staging/preview/info stacked in the right column
ScreenLayout Layout::compute_layout(const cv::Size& screen, const LayoutConfig& config) {
    const int margin = config.margin;
    int play_w = static_cast<int>(screen.width * config.play_width_ratio);

    ScreenLayout layout;
    layout.play_area = cv::Rect(
        margin,
        margin,
        std::max(0, play_w - 2 * margin),
        std::max(0, screen.height - 2 * margin));

    int side_x = play_w + margin;
    int side_w = std::max(0, static_cast<int>(screen.width * config.side_width_ratio) - margin);
    int available_h = std::max(0, screen.height - 2 * margin);

    layout.staging_area = cv::Rect(side_x, margin, side_w, static_cast<int>(available_h * config.staging_height_ratio));

    int preview_size = std::min(side_w, config.preview_max_size);
    int preview_y = layout.staging_area.y + layout.staging_area.height + margin;
    layout.preview_area = cv::Rect(side_x, preview_y, preview_size, preview_size);

    int preview_bottom = layout.preview_area.y + layout.preview_area.height;
    int info_h = std::max(0, screen.height - preview_bottom - 2 * margin);
    layout.info_area = cv::Rect(side_x, preview_bottom + margin, side_w, info_h);

    return layout;
}

MenuLayout Layout::compute_menu_layout(const cv::Size& window, const cv::Size& image) {
    MenuLayout layout;
    layout.window = window;
    layout.page_label_y = MENU_MARGIN + PAGE_LABEL_HEIGHT / 2;

    int top = MENU_MARGIN + PAGE_LABEL_HEIGHT;
    int box_w = std::max(1, window.width - 2 * (MENU_MARGIN + PAGE_BTN_W));
    int box_h = std::max(1, window.height - top - MENU_INFO_HEIGHT);
    layout.image_box = cv::Rect(MENU_MARGIN + PAGE_BTN_W, top, box_w, box_h);
    layout.image = fit_inside(image, layout.image_box);

    int btn_y = top + (box_h - PAGE_BTN_H) / 2;
    layout.prev_button = cv::Rect(MENU_MARGIN, btn_y, PAGE_BTN_W, PAGE_BTN_H);
    layout.next_button = cv::Rect(window.width - MENU_MARGIN - PAGE_BTN_W, btn_y, PAGE_BTN_W, PAGE_BTN_H);

    layout.info_y = top + box_h + 50;
    return layout;
}

cv::Rect Layout::fit_inside(const cv::Size& content, const cv::Rect& box) {
    if (content.width <= 0 || content.height <= 0 || box.width <= 0 || box.height <= 0) {
        return box;
    }

    double scale = std::min(static_cast<double>(box.width) / content.width, static_cast<double>(box.height) / content.height);
    int w = std::clamp(cvRound(content.width * scale), 1, box.width);
    int h = std::clamp(cvRound(content.height * scale), 1, box.height);
    return cv::Rect(box.x + (box.width - w) / 2, box.y + (box.height - h) / 2, w, h);
}

cv::Size Layout::piece_size(const cv::Rect& play_area, GridSize grid) {
    return Slicer::piece_size(play_area.size(), grid);
}

cv::Point Layout::cell_target_position(const cv::Rect& play_area, GridSize grid, GridCell cell) {
    cv::Size piece = piece_size(play_area, grid);
    return cv::Point(play_area.x + cell.col * piece.width, play_area.y + cell.row * piece.height);
}
