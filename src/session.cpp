#include "session.hpp"

#include "piece.hpp"

#include <algorithm>

#include <opencv2/opencv.hpp>


Session::Session(GridSize grid, PieceRegistry registry, GameMode mode) : grid(grid), registry(std::move(registry)), game_mode(mode) {
}

void Session::set_elapsed_time(double seconds) {
    if (!completed) {
        elapsed = std::max(elapsed, seconds);
    }
}

bool Session::check_completion() {
    const auto& all = registry.all();
    bool solved = std::all_of(all.begin(), all.end(), [](const Piece& p) { return p.is_placed; });

    // A failed session stays completed
    completed = solved || failed;
    return solved;
}

double Session::completion_percentage() const {
    if (registry.empty()) {
        return 0.0;
    }
    return 100.0 * registry.placed_count() / static_cast<double>(registry.size());
}

const Piece* Session::get_piece_at(GridCell cell) const {
    for (const auto& piece : registry.all()) {
        if (piece.home_cell == cell && piece.is_placed) {
            return &piece;
        }
    }
    return nullptr;
}

void Session::scatter(const cv::Rect& staging, cv::RNG& rng) {
    for (auto& piece : registry.all()) {
        // Collapse an axis to the origin when the piece does not fit
        int max_x = std::max(staging.x, staging.x + staging.width - piece.size().width);
        int max_y = std::max(staging.y, staging.y + staging.height - piece.size().height);

        // cv::RNG::uniform is exclusive of the upper bound
        int x = rng.uniform(staging.x, max_x + 1);
        int y = rng.uniform(staging.y, max_y + 1);
        piece.position = cv::Point(x, y);
    }
}

void Session::mark_failed() {
    completed = true;
    failed = true;
}

void Session::reset(const cv::Rect& staging, cv::RNG& rng) {
    moves = 0;
    elapsed = 0.0;
    completed = false;
    failed = false;

    registry.reset_pieces();
    scatter(staging, rng);
}
