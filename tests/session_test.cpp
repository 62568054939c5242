#include <gtest/gtest.h>

#include "session.hpp"
#include "piece.hpp"

#include <vector>

#include <opencv2/opencv.hpp>

namespace {

const cv::Rect kPlayArea(0, 0, 200, 200);
const cv::Rect kStaging(300, 20, 150, 120);

Session make_session(GridSize grid, int piece_size = 50, GameMode mode = GameMode::Free) {
    std::vector<cv::Mat> images(grid.count(), cv::Mat(piece_size, piece_size, CV_8UC3, cv::Scalar::all(0)));
    return Session(grid, PieceRegistry::build(images, grid, kPlayArea), mode);
}

void place(Session& session, int id) {
    Piece* piece = session.pieces().find(id);
    piece->position = piece->target_position;
    piece->is_placed = true;
}

} // namespace

TEST(SessionTest, FreshSessionIsActive) {
    Session session = make_session(GridSize{2, 2}, 50, GameMode::Timed);

    EXPECT_EQ(session.grid_size(), (GridSize{2, 2}));
    EXPECT_EQ(session.mode(), GameMode::Timed);
    EXPECT_EQ(session.move_count(), 0);
    EXPECT_DOUBLE_EQ(session.elapsed_time(), 0.0);
    EXPECT_TRUE(session.is_active());
    EXPECT_FALSE(session.is_completed());
    EXPECT_FALSE(session.is_failed());
}

TEST(SessionTest, CompletionPercentage) {
    Session empty(GridSize{1, 1}, PieceRegistry{});
    EXPECT_DOUBLE_EQ(empty.completion_percentage(), 0.0);

    Session session = make_session(GridSize{2, 2});
    EXPECT_DOUBLE_EQ(session.completion_percentage(), 0.0);

    place(session, 0);
    place(session, 3);
    EXPECT_DOUBLE_EQ(session.completion_percentage(), 50.0);
}

TEST(SessionTest, EmptySessionIsTriviallyComplete) {
    Session empty(GridSize{1, 1}, PieceRegistry{});
    EXPECT_TRUE(empty.check_completion());
    EXPECT_TRUE(empty.is_completed());
    EXPECT_FALSE(empty.is_failed());
    EXPECT_DOUBLE_EQ(empty.completion_percentage(), 0.0);
}

TEST(SessionTest, CompletesOnlyWhenEveryPieceIsPlaced) {
    Session session = make_session(GridSize{2, 2});

    for (int id = 0; id < 3; ++id) {
        place(session, id);
        EXPECT_FALSE(session.check_completion());
        EXPECT_TRUE(session.is_active());
    }

    place(session, 3);
    EXPECT_TRUE(session.check_completion());
    EXPECT_TRUE(session.is_completed());
    EXPECT_FALSE(session.is_failed());
    EXPECT_DOUBLE_EQ(session.completion_percentage(), 100.0);
}

TEST(SessionTest, PieceAtCellReportsPlacedPiecesOnly) {
    Session session = make_session(GridSize{2, 3});

    EXPECT_EQ(session.get_piece_at(GridCell{1, 2}), nullptr);

    place(session, 5);
    const Piece* piece = session.get_piece_at(GridCell{1, 2});
    ASSERT_NE(piece, nullptr);
    EXPECT_EQ(piece->id, 5);
    EXPECT_EQ(session.get_piece_at(GridCell{0, 0}), nullptr);
}

TEST(SessionTest, ScatterKeepsPiecesInsideStaging) {
    Session session = make_session(GridSize{2, 2});
    cv::RNG rng(1234);

    for (int round = 0; round < 50; ++round) {
        session.scatter(kStaging, rng);
        for (const auto& piece : session.pieces().all()) {
            ASSERT_TRUE(piece.position.has_value());
            cv::Rect bounds = piece.bounds();
            EXPECT_EQ(bounds & kStaging, bounds) << "piece " << piece.id << " at " << *piece.position;
        }
    }
}

TEST(SessionTest, ScatterCollapsesOversizedAxis) {
    Session session = make_session(GridSize{1, 2}, 130);
    cv::RNG rng(99);

    // 130 wide fits in 150, 130 tall does not fit in 120
    session.scatter(kStaging, rng);
    for (const auto& piece : session.pieces().all()) {
        ASSERT_TRUE(piece.position.has_value());
        EXPECT_EQ(piece.position->y, kStaging.y);
        EXPECT_GE(piece.position->x, kStaging.x);
        EXPECT_LE(piece.position->x, kStaging.x + kStaging.width - 130);
    }
}

TEST(SessionTest, ElapsedTimeIsMonotonicAndFreezesOnCompletion) {
    Session session = make_session(GridSize{1, 1});

    session.set_elapsed_time(5.0);
    session.set_elapsed_time(3.0);
    EXPECT_DOUBLE_EQ(session.elapsed_time(), 5.0);

    place(session, 0);
    ASSERT_TRUE(session.check_completion());

    session.set_elapsed_time(60.0);
    EXPECT_DOUBLE_EQ(session.elapsed_time(), 5.0);
}

TEST(SessionTest, FailureIsTerminal) {
    Session session = make_session(GridSize{2, 2});
    session.mark_failed();

    EXPECT_TRUE(session.is_failed());
    EXPECT_TRUE(session.is_completed());
    EXPECT_FALSE(session.is_active());

    // Rechecking does not revive a failed session
    EXPECT_FALSE(session.check_completion());
    EXPECT_TRUE(session.is_completed());
}

TEST(SessionTest, ResetStartsOver) {
    Session session = make_session(GridSize{2, 2});
    cv::RNG rng(7);

    session.record_move();
    session.record_move();
    session.set_elapsed_time(12.5);
    place(session, 0);
    place(session, 1);
    session.pieces().find(2)->is_dragging = true;
    session.mark_failed();

    session.reset(kStaging, rng);

    EXPECT_EQ(session.move_count(), 0);
    EXPECT_DOUBLE_EQ(session.elapsed_time(), 0.0);
    EXPECT_TRUE(session.is_active());
    EXPECT_FALSE(session.is_failed());
    EXPECT_EQ(session.pieces().placed_count(), 0);

    for (const auto& piece : session.pieces().all()) {
        EXPECT_FALSE(piece.is_dragging);
        ASSERT_TRUE(piece.position.has_value());
        EXPECT_TRUE(kStaging.contains(*piece.position));
    }
}
