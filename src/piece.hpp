#pragma once

#include "main.hpp"

#include <vector>
#include <optional>

#include <opencv2/opencv.hpp>


struct Piece {
    int id = 0;
    GridCell home_cell;
    cv::Mat image;

    std::optional<cv::Point> position;
    cv::Point target_position;

    bool is_dragging = false;
    bool is_placed = false;
    int z_order = 0;

    cv::Size size() const { return image.size(); }

    // Axis-aligned bounds at the current position; empty when not yet scattered
    cv::Rect bounds() const;
    bool contains(const cv::Point& p) const;
    double distance_to_target() const;
};

class PieceRegistry {
public:
    PieceRegistry() = default;

    // One piece per cell in row-major order, targets taken from the play area grid
    static PieceRegistry build(const std::vector<cv::Mat>& images, GridSize grid, const cv::Rect& play_area);

public:
    Piece& add(GridCell home_cell, cv::Mat image, cv::Point target_position);

    size_t size() const { return pieces.size(); }
    bool empty() const { return pieces.empty(); }

    std::vector<Piece>& all() { return pieces; }
    const std::vector<Piece>& all() const { return pieces; }

    Piece* find(int id);
    const Piece* find(int id) const;

    // Topmost piece under the pointer, placed or not
    Piece* hit_test(const cv::Point& p);

    // Strictly greater than every z-order handed out or held so far
    int next_z_order();

    int placed_count() const;
    std::vector<const Piece*> draw_order() const;

    void retarget(GridSize grid, const cv::Rect& play_area);
    void reset_pieces();

private:
    std::vector<Piece> pieces;
    int max_z_order = 0;
};
