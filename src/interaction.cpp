#include "interaction.hpp"

#include "piece.hpp"

#include <optional>

#include <opencv2/opencv.hpp>


Interaction::Interaction(double snap_threshold) : threshold(snap_threshold), drag(std::nullopt) {
}

std::optional<int> Interaction::dragged_piece_id() const {
    if (!drag) {
        return std::nullopt;
    }
    return drag->piece_id;
}

bool Interaction::start_drag(PieceRegistry& registry, const cv::Point& pointer) {
    if (drag) {
        return false;
    }
    return start_drag(registry, registry.hit_test(pointer), pointer);
}

bool Interaction::start_drag(PieceRegistry& registry, Piece* piece, const cv::Point& pointer) {
    // Placed pieces stay put, and only one drag may be active
    if (!piece || piece->is_placed || drag) {
        return false;
    }

    cv::Point offset = piece->position ? pointer - *piece->position : cv::Point(0, 0);
    piece->is_dragging = true;
    piece->z_order = registry.next_z_order();

    drag = DragState{piece->id, offset};
    return true;
}

void Interaction::update_drag(PieceRegistry& registry, const cv::Point& pointer) {
    if (!drag) {
        return;
    }

    Piece* piece = registry.find(drag->piece_id);
    if (piece) {
        piece->position = pointer - drag->offset;
    }
}

bool Interaction::end_drag(PieceRegistry& registry) {
    if (!drag) {
        return false;
    }

    Piece* piece = registry.find(drag->piece_id);
    bool snapped = piece && check_snap(*piece);
    release(registry);
    return snapped;
}

void Interaction::cancel_drag(PieceRegistry& registry) {
    release(registry);
}

bool Interaction::check_snap(Piece& piece) const {
    if (piece.is_placed) {
        return false;
    }

    if (piece.distance_to_target() > threshold) {
        return false;
    }

    piece.position = piece.target_position;
    piece.is_placed = true;
    return true;
}

Piece* Interaction::release(PieceRegistry& registry) {
    if (!drag) {
        return nullptr;
    }

    Piece* piece = registry.find(drag->piece_id);
    if (piece) {
        piece->is_dragging = false;
    }
    drag.reset();
    return piece;
}
