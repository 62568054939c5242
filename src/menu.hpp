#pragma once

#include "main.hpp"
#include "layout.hpp"
#include "text_renderer.hpp"

#include <string>
#include <vector>
#include <optional>

#include <opencv2/opencv.hpp>

enum class MenuHover {
    None,
    Left,
    Right,
    Image
};

struct MenuCallbackState {
    MenuLayout layout;
    int page;
    int total_pages;

    int selected = -1;
    int nav_dir = 0;
    MenuHover hover = MenuHover::None;
};

class Menu {
public:
    Menu(TextRenderer& text, std::vector<GridSize> grid_options);

    std::optional<MenuSelection> show(const std::vector<CatalogEntry>& entries, const std::vector<cv::Mat>& previews, int page, GameMode mode, GridSize grid);

    static MenuHover hover_at(const MenuLayout& layout, int x, int y);
    static void on_mouse(int event, int x, int y, int flags, void* userdata);

private:
    void draw_arrow_btn(cv::Mat& canvas, const cv::Rect& button, bool hover, const std::string& arrow);
    void draw_puzzle_info(cv::Mat& canvas, const CatalogEntry& entry, const MenuLayout& layout, GameMode mode, GridSize grid);
    cv::Mat draw_menu(const MenuCallbackState& state, const std::vector<CatalogEntry>& entries, const std::vector<cv::Mat>& previews, GameMode mode, GridSize grid);

    GridSize next_grid(GridSize grid) const;

    TextRenderer& text;
    std::vector<GridSize> grid_options;
};
