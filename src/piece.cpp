#include "piece.hpp"

#include "util.hpp"
#include "layout.hpp"

#include <vector>
#include <algorithm>
#include <stdexcept>

#include <opencv2/opencv.hpp>


cv::Rect Piece::bounds() const {
    if (!position) {
        return cv::Rect();
    }
    return cv::Rect(*position, image.size());
}

bool Piece::contains(const cv::Point& p) const {
    return position && bounds().contains(p);
}

double Piece::distance_to_target() const {
    return Util::distance(position, target_position);
}

PieceRegistry PieceRegistry::build(const std::vector<cv::Mat>& images, GridSize grid, const cv::Rect& play_area) {
    if (static_cast<int>(images.size()) != grid.count()) {
        throw std::invalid_argument("Expected " + std::to_string(grid.count()) + " piece images, got " + std::to_string(images.size()));
    }

    PieceRegistry registry;
    int idx = 0;

    for (int row = 0; row < grid.rows; ++row) {
        for (int col = 0; col < grid.cols; ++col, ++idx) {
            GridCell cell{row, col};
            registry.add(cell, images[idx], Layout::cell_target_position(play_area, grid, cell));
        }
    }
    return registry;
}

Piece& PieceRegistry::add(GridCell home_cell, cv::Mat image, cv::Point target_position) {
    Piece piece;
    piece.id = static_cast<int>(pieces.size());
    piece.home_cell = home_cell;
    piece.image = std::move(image);
    piece.target_position = target_position;
    pieces.push_back(std::move(piece));
    return pieces.back();
}

Piece* PieceRegistry::find(int id) {
    if (id < 0 || id >= static_cast<int>(pieces.size())) {
        return nullptr;
    }
    return &pieces[id];
}

const Piece* PieceRegistry::find(int id) const {
    if (id < 0 || id >= static_cast<int>(pieces.size())) {
        return nullptr;
    }
    return &pieces[id];
}

Piece* PieceRegistry::hit_test(const cv::Point& p) {
    Piece* top = nullptr;

    // Equal z-orders fall back to the higher id, which is drawn later
    for (auto& piece : pieces) {
        if (!piece.contains(p)) {
            continue;
        }
        if (!top || piece.z_order > top->z_order || (piece.z_order == top->z_order && piece.id > top->id)) {
            top = &piece;
        }
    }
    return top;
}

int PieceRegistry::next_z_order() {
    for (const auto& piece : pieces) {
        max_z_order = std::max(max_z_order, piece.z_order);
    }
    return ++max_z_order;
}

int PieceRegistry::placed_count() const {
    return static_cast<int>(std::count_if(pieces.begin(), pieces.end(), [](const Piece& p) { return p.is_placed; }));
}

std::vector<const Piece*> PieceRegistry::draw_order() const {
    std::vector<const Piece*> order;
    order.reserve(pieces.size());

    for (const auto& piece : pieces) {
        order.push_back(&piece);
    }

    std::sort(order.begin(), order.end(), [](const Piece* a, const Piece* b) {
        return a->z_order != b->z_order ? a->z_order < b->z_order : a->id < b->id;
    });
    return order;
}

void PieceRegistry::retarget(GridSize grid, const cv::Rect& play_area) {
    for (auto& piece : pieces) {
        piece.target_position = Layout::cell_target_position(play_area, grid, piece.home_cell);
        if (piece.is_placed) {
            piece.position = piece.target_position;
        }
    }
}

void PieceRegistry::reset_pieces() {
    for (auto& piece : pieces) {
        piece.is_placed = false;
        piece.is_dragging = false;
        piece.z_order = 0;
    }
}
