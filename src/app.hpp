#pragma once

#include "main.hpp"
#include "menu.hpp"
#include "config.hpp"
#include "renderer.hpp"
#include "text_renderer.hpp"

#include <memory>
#include <string>
#include <vector>
#include <optional>

#include <opencv2/opencv.hpp>


class Game;

struct AppOptions {
    std::string config_path = CONFIG_FILE;
    std::string image_path;
    std::optional<GameMode> mode;
    std::optional<GridSize> grid;
};

class App {
public:
    explicit App(const Config& config);
    ~App();

    // Returns the process exit status
    int run(const AppOptions& options);

    // OpenCV callback as static wrapper
    static void on_mouse(int event, int x, int y, int flags, void* userdata);

private:
    void on_mouse_impl(int event, int x, int y, int flags);

    // Returns false when the window was closed
    bool play(const cv::Mat& source, const std::string& title, GridSize grid, GameMode mode);
    void log_outcome(const Game& game) const;

    std::vector<cv::Mat> load_previews(const std::vector<CatalogEntry>& entries) const;

    Config config;
    std::unique_ptr<TextRenderer> text;
    std::unique_ptr<Renderer> renderer;
    std::unique_ptr<Menu> menu;

    // Pointer events collected by the mouse callback, drained once per loop iteration
    std::vector<PointerEvent> pending;
};
