#include "app.hpp"

#include "game.hpp"
#include "util.hpp"
#include "slicer.hpp"
#include "catalog.hpp"
#include "image_error.hpp"

#include <string>
#include <vector>
#include <memory>
#include <iostream>

#include <opencv2/opencv.hpp>


void App::on_mouse(int event, int x, int y, int flags, void* userdata) {
    if (userdata) {
        static_cast<App*>(userdata)->on_mouse_impl(event, x, y, flags);
    }
}

App::App(const Config& config)
    : config(config),
      text(std::make_unique<TextRenderer>(config.font)),
      renderer(std::make_unique<Renderer>(*text, config.window)),
      menu(std::make_unique<Menu>(*text, config.grid_options)) {
}

App::~App() {
    cv::destroyAllWindows();
}

void App::on_mouse_impl(int event, int x, int y, int) {
    switch (event) {
        case cv::EVENT_LBUTTONDOWN: pending.push_back({PointerAction::Down, cv::Point(x, y)}); break;
        case cv::EVENT_MOUSEMOVE:   pending.push_back({PointerAction::Move, cv::Point(x, y)}); break;
        case cv::EVENT_LBUTTONUP:   pending.push_back({PointerAction::Up, cv::Point(x, y)}); break;
        default: break;
    }
}

std::vector<cv::Mat> App::load_previews(const std::vector<CatalogEntry>& entries) const {
    std::vector<cv::Mat> previews;

    for (const auto& entry : entries) {
        try {
            cv::Mat img = Catalog::load_image(config.catalog_data, entry);
            previews.push_back(Slicer::make_thumbnail(img, cv::Size(MENU_WIN_W, MENU_WIN_H)));
        }
        catch (const ImageError& e) {
            std::cerr << "Failed to load preview for: " << entry.name << " (" << e.what() << ")" << std::endl;
            previews.push_back(cv::Mat(128, 128, CV_8UC3, cv::Scalar(50, 50, 50)));
        }
    }
    return previews;
}

int App::run(const AppOptions& options) {
    GameMode mode = options.mode.value_or(config.default_mode);
    GridSize grid = options.grid.value_or(config.default_grid);

    // A single image given on the command line skips the menu
    if (!options.image_path.empty()) {
        cv::Mat source = Slicer::load_image(options.image_path);
        play(source, options.image_path, grid, mode);
        std::cout << "Exiting game..." << std::endl;
        return 0;
    }

    std::vector<CatalogEntry> entries;
    try {
        entries = Catalog::load_meta(config.catalog_meta);
    }
    catch (const std::runtime_error& e) {
        std::cerr << e.what() << std::endl;
    }

    auto stock = Catalog::scan_directory(config.stock_images_dir);
    entries.insert(entries.end(), stock.begin(), stock.end());

    if (entries.empty()) {
        std::cerr << "No puzzles found in " << config.catalog_meta << " or " << config.stock_images_dir << std::endl;
        std::cerr << "Use --image PATH to play with your own picture." << std::endl;
        return 1;
    }

    std::vector<cv::Mat> previews = load_previews(entries);
    int last_page = 0;

    while (true) {
        auto selection = menu->show(entries, previews, last_page, mode, grid);
        if (!selection) {
            break;
        }

        last_page = selection->pick;
        mode = selection->mode;
        grid = selection->grid;

        const auto& entry = entries[selection->pick];
        cv::Mat source = Catalog::load_image(config.catalog_data, entry);

        if (!play(source, entry.name, grid, mode)) {
            break;
        }
    }

    std::cout << "Exiting game..." << std::endl;
    return 0;
}

bool App::play(const cv::Mat& source, const std::string& title, GridSize grid, GameMode mode) {
    Game game(source, grid, mode, config);

    std::cout << "Starting " << title << " as " << grid.rows << "x" << grid.cols << " in " << Util::mode_name(mode) << " mode" << std::endl;
    if (auto seconds = game.time_limit()) {
        std::cout << "Time limit: " << *seconds << " seconds" << std::endl;
    }
    if (auto moves = game.move_limit()) {
        std::cout << "Move limit: " << *moves << " moves" << std::endl;
    }

    pending.clear();
    cv::namedWindow(WIN_NAME, cv::WINDOW_AUTOSIZE);
    cv::setMouseCallback(WIN_NAME, App::on_mouse, this);
    game.start(Game::Clock::now());
    cv::imshow(WIN_NAME, renderer->render(game.snapshot()));

    bool was_completed = false;
    bool window_open = true;

    while (true) {
        int key = cv::waitKey(1);
        if (cv::getWindowProperty(WIN_NAME, cv::WND_PROP_VISIBLE) < 1) {
            window_open = false;
            break;
        }

        // Each queued pointer event is fully applied before the next
        std::vector<PointerEvent> events;
        events.swap(pending);
        for (const auto& event : events) {
            if (game.handle_pointer(event)) {
                const Session& s = game.session();
                std::cout << "Piece placed! Move: " << s.move_count() << " | Completion: " << static_cast<int>(s.completion_percentage()) << "%" << std::endl;
            }
        }

        if (key == KEY_ESCAPE) {
            if (!game.handle_action(GameAction::CancelOrQuit)) {
                break;
            }
        }
        else if (key == 'n' || key == 'N') {
            game.handle_action(GameAction::NewGame);
            was_completed = false;
            std::cout << "New game started!" << std::endl;
        }

        game.tick(Game::Clock::now());

        if (game.session().is_completed() && !was_completed) {
            was_completed = true;
            log_outcome(game);
        }

        cv::imshow(WIN_NAME, renderer->render(game.snapshot()));
    }

    if (window_open) {
        cv::setMouseCallback(WIN_NAME, nullptr, nullptr);
    }
    return window_open;
}

void App::log_outcome(const Game& game) const {
    const Session& s = game.session();

    if (s.is_failed()) {
        std::cout << (game.time_limit() ? "Time's up! Game over." : "Move limit reached! Game over.") << std::endl;
    }
    else {
        std::cout << "Congratulations! You completed the puzzle in " << s.move_count() << " moves!" << std::endl;
    }
    std::cout << "Time: " << Util::format_clock(s.elapsed_time()) << " | Completion: " << static_cast<int>(s.completion_percentage()) << "%" << std::endl;
}
