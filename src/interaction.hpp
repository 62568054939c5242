#pragma once

#include "piece.hpp"

#include <optional>

#include <opencv2/opencv.hpp>

constexpr double DEFAULT_SNAP_THRESHOLD = 40.0;

// Payload of the Dragging state; Idle when absent
struct DragState {
    int piece_id;
    cv::Point offset;
};

class Interaction {
public:
    explicit Interaction(double snap_threshold = DEFAULT_SNAP_THRESHOLD);

    double snap_threshold() const { return threshold; }
    bool is_dragging() const { return drag.has_value(); }
    std::optional<int> dragged_piece_id() const;

    // Picks the topmost piece under the pointer. Returns false if nothing was picked up.
    bool start_drag(PieceRegistry& registry, const cv::Point& pointer);
    bool start_drag(PieceRegistry& registry, Piece* piece, const cv::Point& pointer);

    void update_drag(PieceRegistry& registry, const cv::Point& pointer);

    // Returns true if the released piece snapped into its cell
    bool end_drag(PieceRegistry& registry);
    void cancel_drag(PieceRegistry& registry);

    bool check_snap(Piece& piece) const;

private:
    Piece* release(PieceRegistry& registry);

    double threshold;
    std::optional<DragState> drag;
};
