#include "game.hpp"

#include "layout.hpp"
#include "slicer.hpp"

#include <chrono>
#include <vector>
#include <optional>

#include <opencv2/opencv.hpp>


Game::Game(const cv::Mat& source, GridSize grid, GameMode mode, const Config& config, uint64_t seed)
    : config(config),
      screen(Layout::compute_layout(config.window, config.layout)),
      sliced(Slicer::fit_and_slice(source, screen.play_area.size(), grid)),
      state(grid, PieceRegistry::build(sliced.pieces, grid, screen.play_area), mode),
      drag(config.snap_threshold),
      rng(seed),
      started(Clock::now()) {

    preview = Slicer::make_thumbnail(sliced.fitted, screen.preview_area.size() - cv::Size(10, 10));

    // The registry holds its own copies of the pieces
    sliced.pieces.clear();

    state.scatter(screen.staging_area, rng);
}

bool Game::handle_pointer(const PointerEvent& event) {
    PieceRegistry& registry = state.pieces();

    switch (event.action) {
        case PointerAction::Down:
            if (state.is_active()) {
                drag.start_drag(registry, event.pos);
            }
            return false;

        case PointerAction::Move:
            drag.update_drag(registry, event.pos);
            return false;

        case PointerAction::Up:
            break;
    }

    if (!drag.end_drag(registry)) {
        return false;
    }

    state.record_move();

    // Completion is settled before any limit so a winning last move is never a loss
    state.check_completion();
    enforce_limits();
    return true;
}

bool Game::handle_action(GameAction action) {
    switch (action) {
        case GameAction::NewGame:
            new_game(Clock::now());
            return true;

        case GameAction::CancelOrQuit:
            if (drag.is_dragging()) {
                drag.cancel_drag(state.pieces());
                return true;
            }
            return false;
    }
    return true;
}

void Game::start(Clock::time_point now) {
    started = now;
}

void Game::tick(Clock::time_point now) {
    if (!state.is_active()) {
        return;
    }

    std::chrono::duration<double> elapsed = now - started;
    state.set_elapsed_time(elapsed.count());
    enforce_limits();
}

void Game::new_game(Clock::time_point now) {
    drag.cancel_drag(state.pieces());
    state.reset(screen.staging_area, rng);
    started = now;
}

std::optional<double> Game::time_limit() const {
    if (state.mode() != GameMode::Timed) {
        return std::nullopt;
    }
    return static_cast<double>(state.pieces().size()) * config.seconds_per_piece;
}

std::optional<int> Game::move_limit() const {
    if (state.mode() != GameMode::Challenge) {
        return std::nullopt;
    }
    return static_cast<int>(state.pieces().size()) * config.moves_per_piece;
}

void Game::enforce_limits() {
    if (!state.is_active() || state.check_completion()) {
        return;
    }

    auto seconds = time_limit();
    auto moves = move_limit();
    bool out_of_time = seconds && state.elapsed_time() >= *seconds;
    bool out_of_moves = moves && state.move_count() >= *moves;

    if (out_of_time || out_of_moves) {
        state.mark_failed();
        drag.cancel_drag(state.pieces());
    }
}

FrameSnapshot Game::snapshot() const {
    FrameSnapshot frame;
    frame.layout = screen;
    frame.grid = state.grid_size();
    frame.preview = preview;

    for (const Piece* piece : state.pieces().draw_order()) {
        if (!piece->position) {
            continue;
        }
        frame.pieces.push_back(PieceView{piece->id, piece->image, *piece->position, piece->is_dragging, piece->is_placed});
    }

    SessionStats& stats = frame.stats;
    stats.elapsed_time = state.elapsed_time();
    stats.move_count = state.move_count();
    stats.completion_percentage = state.completion_percentage();
    stats.placed_count = state.pieces().placed_count();
    stats.piece_count = static_cast<int>(state.pieces().size());
    stats.mode = state.mode();
    stats.is_completed = state.is_completed();
    stats.is_failed = state.is_failed();
    stats.time_limit = time_limit();
    stats.move_limit = move_limit();
    return frame;
}
