#include "menu.hpp"

#include "util.hpp"
#include "renderer.hpp"

#include <string>
#include <vector>
#include <optional>
#include <algorithm>

#include <opencv2/opencv.hpp>


const cv::Scalar BORDER_COLOR(80, 140, 220);
const cv::Scalar HOVER_COLOR(180, 220, 255);
constexpr int BORDER_THICK = 4;
constexpr int HOVER_THICK = 8;


Menu::Menu(TextRenderer& text, std::vector<GridSize> grid_options) : text(text), grid_options(std::move(grid_options)) {}

MenuHover Menu::hover_at(const MenuLayout& layout, int x, int y) {
    cv::Point p(x, y);
    if (layout.prev_button.contains(p)) {
        return MenuHover::Left;
    }
    if (layout.next_button.contains(p)) {
        return MenuHover::Right;
    }
    return layout.image.contains(p) ? MenuHover::Image : MenuHover::None;
}

void Menu::on_mouse(int event, int x, int y, int, void* userdata) {
    auto* state = static_cast<MenuCallbackState*>(userdata);
    if (!state) {
        return;
    }

    MenuHover hover = hover_at(state->layout, x, y);

    if (event == cv::EVENT_MOUSEMOVE) {
        state->hover = hover;
        return;
    }

    if (event != cv::EVENT_LBUTTONDOWN) {
        return;
    }

    if (hover == MenuHover::Left && state->page > 0) {
        state->nav_dir = -1;
    }
    else if (hover == MenuHover::Right && state->page < state->total_pages - 1) {
        state->nav_dir = 1;
    }
    else if (hover == MenuHover::Image) {
        state->selected = state->page;
    }
}

void Menu::draw_arrow_btn(cv::Mat& canvas, const cv::Rect& button, bool hover, const std::string& arrow) {
    cv::Scalar color = hover ? HOVER_COLOR : BORDER_COLOR;

    cv::rectangle(canvas, button, color, cv::FILLED);
    cv::rectangle(canvas, button, color, hover ? HOVER_THICK : BORDER_THICK);

    text.set_height(PAGE_LABEL_HEIGHT);
    text.draw_text(canvas, arrow, (button.tl() + button.br()) / 2 + cv::Point(0, 12), cv::Scalar(255, 255, 255), true);
}

void Menu::draw_puzzle_info(cv::Mat& canvas, const CatalogEntry& entry, const MenuLayout& layout, GameMode mode, GridSize grid) {
    int info_center_x = layout.window.width / 2;
    int info_y = layout.info_y;

    text.set_height(32);
    text.draw_text(canvas, entry.name, cv::Point(info_center_x, info_y), TEXT_COLOR, true);

    if (!entry.artist.empty()) {
        text.set_height(22);
        text.draw_text(canvas, entry.artist, cv::Point(info_center_x, info_y + 36), cv::Scalar(200, 200, 200), true);
    }

    std::string settings = std::string("Mode: ") + Util::mode_name(mode) + "    Grid: " + std::to_string(grid.rows) + "x" + std::to_string(grid.cols);
    text.set_height(24);
    text.draw_text(canvas, settings, cv::Point(info_center_x, info_y + 80), ACCENT_COLOR, true);

    text.set_height(16);
    text.draw_text(canvas, "1: Free   2: Timed   3: Challenge   G: Grid size   ESC: Exit", cv::Point(info_center_x, layout.window.height - 24), HINT_COLOR, true);
}

cv::Mat Menu::draw_menu(const MenuCallbackState& state, const std::vector<CatalogEntry>& entries, const std::vector<cv::Mat>& previews, GameMode mode, GridSize grid) {
    const MenuLayout& menu_layout = state.layout;
    int idx = state.page;

    cv::Mat canvas(menu_layout.window, CV_8UC3, BACKGROUND_COLOR);
    std::string nav = std::to_string(idx + 1) + "/" + std::to_string(state.total_pages);
    text.set_height(PAGE_LABEL_HEIGHT / 2 + 6);
    text.draw_text(canvas, nav, cv::Point(menu_layout.window.width / 2, menu_layout.page_label_y + 8), TEXT_COLOR, true);

    if (!previews[idx].empty()) {
        cv::Mat thumb;
        cv::resize(previews[idx], thumb, menu_layout.image.size(), 0, 0, cv::INTER_AREA);
        thumb.copyTo(canvas(menu_layout.image));
    }

    bool over_image = state.hover == MenuHover::Image;
    cv::rectangle(canvas, menu_layout.image, over_image ? HOVER_COLOR : BORDER_COLOR, over_image ? HOVER_THICK : BORDER_THICK);

    if (idx > 0) {
        draw_arrow_btn(canvas, menu_layout.prev_button, state.hover == MenuHover::Left, "←");
    }
    if (idx < state.total_pages - 1) {
        draw_arrow_btn(canvas, menu_layout.next_button, state.hover == MenuHover::Right, "→");
    }

    draw_puzzle_info(canvas, entries[idx], menu_layout, mode, grid);
    return canvas;
}

GridSize Menu::next_grid(GridSize grid) const {
    auto it = std::find(grid_options.begin(), grid_options.end(), grid);
    if (it == grid_options.end() || ++it == grid_options.end()) {
        return grid_options.front();
    }
    return *it;
}

std::optional<MenuSelection> Menu::show(const std::vector<CatalogEntry>& entries, const std::vector<cv::Mat>& previews, int page, GameMode mode, GridSize grid) {
    if (entries.empty()) {
        return std::nullopt;
    }

    int current_page = Util::clamp(page, 0, static_cast<int>(entries.size()) - 1);
    int total_pages = static_cast<int>(entries.size());

    cv::namedWindow(WIN_NAME, cv::WINDOW_AUTOSIZE);

    while (true) {
        MenuCallbackState cb_state{Layout::compute_menu_layout(cv::Size(MENU_WIN_W, MENU_WIN_H), previews[current_page].size()), current_page, total_pages};
        cv::setMouseCallback(WIN_NAME, Menu::on_mouse, &cb_state);

        MenuHover drawn_hover = cb_state.hover;
        cv::imshow(WIN_NAME, draw_menu(cb_state, entries, previews, mode, grid));

        while (cb_state.selected == -1 && cb_state.nav_dir == 0) {
            int key = cv::waitKey(10);
            if (cv::getWindowProperty(WIN_NAME, cv::WND_PROP_VISIBLE) < 1 || key == KEY_ESCAPE) {
                cv::setMouseCallback(WIN_NAME, nullptr, nullptr);
                return std::nullopt;
            }

            bool changed = false;
            if (key == '1' || key == '2' || key == '3') {
                mode = key == '1' ? GameMode::Free : key == '2' ? GameMode::Timed : GameMode::Challenge;
                changed = true;
            }
            else if (key == 'g' || key == 'G') {
                grid = next_grid(grid);
                changed = true;
            }
            else if (key == 13 || key == 10) {
                cb_state.selected = current_page;
            }

            if (changed || cb_state.hover != drawn_hover) {
                drawn_hover = cb_state.hover;
                cv::imshow(WIN_NAME, draw_menu(cb_state, entries, previews, mode, grid));
            }
        }

        cv::setMouseCallback(WIN_NAME, nullptr, nullptr);

        if (cb_state.selected != -1) {
            return MenuSelection{cb_state.selected, mode, grid};
        }

        current_page += cb_state.nav_dir;
    }
}
