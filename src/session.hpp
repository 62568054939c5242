#pragma once

#include "main.hpp"
#include "piece.hpp"

#include <opencv2/opencv.hpp>


class Session {
public:
    Session(GridSize grid, PieceRegistry registry, GameMode mode = GameMode::Free);

public:
    GridSize grid_size() const { return grid; }
    GameMode mode() const { return game_mode; }

    PieceRegistry& pieces() { return registry; }
    const PieceRegistry& pieces() const { return registry; }

    int move_count() const { return moves; }
    void record_move() { ++moves; }

    double elapsed_time() const { return elapsed; }
    void set_elapsed_time(double seconds);

    bool is_completed() const { return completed; }
    bool is_failed() const { return failed; }
    bool is_active() const { return !completed; }

    bool check_completion();
    double completion_percentage() const;
    const Piece* get_piece_at(GridCell cell) const;

    void scatter(const cv::Rect& staging, cv::RNG& rng);
    void mark_failed();
    void reset(const cv::Rect& staging, cv::RNG& rng);

private:
    GridSize grid;
    PieceRegistry registry;
    GameMode game_mode;

    int moves = 0;
    double elapsed = 0.0;
    bool completed = false;
    bool failed = false;
};
