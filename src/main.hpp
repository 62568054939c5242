#pragma once

#include <string>
#include <vector>
#include <optional>

#include <opencv2/opencv.hpp>

constexpr const char* WIN_NAME = "ReAssemble Jigsaw Puzzle";
constexpr const char* CONFIG_FILE = "res/config.json";
constexpr const char* FONT_FILE = "res/NotoSansJP-Regular.ttf";
constexpr const char* PUZZLE_DATA_FILE = "res/puzzles.dat";
constexpr const char* PUZZLE_META_FILE = "res/puzzles.json";
constexpr const char* STOCK_IMAGES_DIR = "res/stock_images";

constexpr int KEY_ESCAPE = 27;

// Picture browser window
constexpr int MENU_WIN_W = 900;
constexpr int MENU_WIN_H = 700;
constexpr int MENU_MARGIN = 20;
constexpr int MENU_INFO_HEIGHT = 184;
constexpr int PAGE_LABEL_HEIGHT = 36;
constexpr int PAGE_BTN_W = 60;
constexpr int PAGE_BTN_H = 120;

struct GridSize {
    int rows = 0;
    int cols = 0;

    int count() const { return rows * cols; }
    bool valid() const { return rows > 0 && cols > 0; }
    bool operator==(const GridSize&) const = default;
};

struct GridCell {
    int row = 0;
    int col = 0;

    bool operator==(const GridCell&) const = default;
};

enum class GameMode {
    Free,
    Timed,
    Challenge
};

struct ScreenLayout {
    cv::Rect play_area;
    cv::Rect staging_area;
    cv::Rect preview_area;
    cv::Rect info_area;
};

enum class PointerAction {
    Down,
    Move,
    Up
};

struct PointerEvent {
    PointerAction action;
    cv::Point pos;
};

enum class GameAction {
    NewGame,
    CancelOrQuit
};

// One drawable piece as seen by the renderer
struct PieceView {
    int id;
    cv::Mat image;
    cv::Point position;
    bool is_dragging;
    bool is_placed;
};

struct SessionStats {
    double elapsed_time = 0.0;
    int move_count = 0;
    double completion_percentage = 0.0;
    int placed_count = 0;
    int piece_count = 0;

    GameMode mode = GameMode::Free;
    bool is_completed = false;
    bool is_failed = false;

    std::optional<double> time_limit;
    std::optional<int> move_limit;
};

struct FrameSnapshot {
    std::vector<PieceView> pieces;
    ScreenLayout layout;
    GridSize grid;
    SessionStats stats;
    cv::Mat preview;
};

struct CatalogEntry {
    std::string name;
    std::string artist;

    // Set for loose image files, empty for entries packed in the data file
    std::string path;

    int offset = 0;
    int length = 0;
};

struct MenuSelection {
    int pick;
    GameMode mode;
    GridSize grid;
};
