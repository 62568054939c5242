#include "renderer.hpp"

#include "util.hpp"

#include <string>
#include <vector>

#include <opencv2/opencv.hpp>


Renderer::Renderer(TextRenderer& text, const cv::Size& window) : text(text), window(window) {
}

void Renderer::blit(cv::Mat& canvas, const cv::Mat& image, const cv::Point& pos) {
    cv::Rect dst(pos, image.size());
    cv::Rect visible = dst & cv::Rect(0, 0, canvas.cols, canvas.rows);
    if (visible.empty()) {
        return;
    }

    cv::Rect src(visible.tl() - dst.tl(), visible.size());
    image(src).copyTo(canvas(visible));
}

cv::Mat Renderer::render(const FrameSnapshot& frame) {
    cv::Mat canvas(window, CV_8UC3, BACKGROUND_COLOR);

    draw_play_area(canvas, frame);
    draw_staging_area(canvas, frame);

    for (const auto& piece : frame.pieces) {
        draw_piece(canvas, piece);
    }

    draw_preview(canvas, frame);
    draw_info_panel(canvas, frame);

    if (frame.stats.is_completed) {
        draw_completion_overlay(canvas, frame.stats);
    }
    return canvas;
}

void Renderer::draw_play_area(cv::Mat& canvas, const FrameSnapshot& frame) {
    const cv::Rect& area = frame.layout.play_area;
    cv::rectangle(canvas, area, PLAY_AREA_BG, cv::FILLED);

    int piece_w = area.width / frame.grid.cols;
    int piece_h = area.height / frame.grid.rows;

    for (int col = 1; col < frame.grid.cols; ++col) {
        int x = area.x + col * piece_w;
        cv::line(canvas, cv::Point(x, area.y), cv::Point(x, area.y + area.height), GRID_LINE_COLOR, GRID_LINE_WIDTH);
    }

    for (int row = 1; row < frame.grid.rows; ++row) {
        int y = area.y + row * piece_h;
        cv::line(canvas, cv::Point(area.x, y), cv::Point(area.x + area.width, y), GRID_LINE_COLOR, GRID_LINE_WIDTH);
    }

    cv::rectangle(canvas, area, GRID_LINE_COLOR, GRID_LINE_WIDTH);
}

void Renderer::draw_staging_area(cv::Mat& canvas, const FrameSnapshot& frame) {
    cv::rectangle(canvas, frame.layout.staging_area, STAGING_AREA_BG, cv::FILLED);
    cv::rectangle(canvas, frame.layout.staging_area, GRID_LINE_COLOR, GRID_LINE_WIDTH);
}

void Renderer::draw_piece(cv::Mat& canvas, const PieceView& piece) {
    if (piece.is_dragging) {
        cv::Rect shadow(piece.position + cv::Point(SHADOW_OFFSET, SHADOW_OFFSET), piece.image.size());
        shadow &= cv::Rect(0, 0, canvas.cols, canvas.rows);

        if (!shadow.empty()) {
            cv::Mat roi = canvas(shadow);
            roi.convertTo(roi, -1, 0.5);
        }
    }

    blit(canvas, piece.image, piece.position);
}

void Renderer::draw_preview(cv::Mat& canvas, const FrameSnapshot& frame) {
    const cv::Rect& area = frame.layout.preview_area;
    if (area.empty()) {
        return;
    }

    cv::rectangle(canvas, area, cv::Scalar(255, 255, 255), cv::FILLED);

    if (!frame.preview.empty()) {
        cv::Point origin(area.x + (area.width - frame.preview.cols) / 2, area.y + (area.height - frame.preview.rows) / 2);
        blit(canvas, frame.preview, origin);
    }
    else {
        text.set_height(20);
        text.draw_text(canvas, "Preview", cv::Point(area.x + area.width / 2, area.y + area.height / 2), cv::Scalar(100, 100, 100), true);
    }

    cv::rectangle(canvas, area, GRID_LINE_COLOR, GRID_LINE_WIDTH);
}

void Renderer::draw_info_panel(cv::Mat& canvas, const FrameSnapshot& frame) {
    const cv::Rect& area = frame.layout.info_area;
    if (area.empty()) {
        return;
    }

    cv::rectangle(canvas, area, INFO_AREA_BG, cv::FILLED);
    cv::rectangle(canvas, area, GRID_LINE_COLOR, GRID_LINE_WIDTH);

    const SessionStats& stats = frame.stats;

    text.set_height(24);
    text.draw_text(canvas, "Statistics", cv::Point(area.x + area.width / 2, area.y + 30), TEXT_COLOR, true);

    std::string mode_line = std::string("Mode: ") + Util::mode_name(stats.mode);
    std::string time_line = "Time: " + Util::format_clock(stats.elapsed_time);
    if (stats.time_limit) {
        time_line += " / " + Util::format_clock(*stats.time_limit);
    }
    std::string moves_line = "Moves: " + std::to_string(stats.move_count);
    if (stats.move_limit) {
        moves_line += " / " + std::to_string(*stats.move_limit);
    }

    std::vector<std::string> lines{
        mode_line,
        time_line,
        "Completion: " + std::to_string(static_cast<int>(stats.completion_percentage)) + "%",
        "Pieces: " + std::to_string(stats.placed_count) + "/" + std::to_string(stats.piece_count),
        moves_line
    };

    text.set_height(18);
    int y = area.y + 58;
    for (const auto& line : lines) {
        if (y > area.y + area.height - 30) {
            break;
        }
        text.draw_text(canvas, line, cv::Point(area.x + 15, y), TEXT_COLOR);
        y += 24;
    }

    text.set_height(13);
    text.draw_text(canvas, "ESC: Cancel / Exit   N: New game", cv::Point(area.x + 15, area.y + area.height - 10), HINT_COLOR);
}

void Renderer::draw_completion_overlay(cv::Mat& canvas, const SessionStats& stats) {
    cv::Mat overlay = canvas.clone();
    cv::rectangle(overlay, cv::Rect(0, 0, canvas.cols, canvas.rows), cv::Scalar(0, 0, 0), cv::FILLED);
    cv::addWeighted(overlay, 0.7, canvas, 0.3, 0, canvas);

    int box_w = std::min(600, canvas.cols);
    int box_h = std::min(400, canvas.rows);
    int cx = canvas.cols / 2;
    int cy = canvas.rows / 2;
    cv::Rect box(cx - box_w / 2, cy - box_h / 2, box_w, box_h);

    const cv::Scalar& title_color = stats.is_failed ? FAILURE_COLOR : ACCENT_COLOR;
    cv::rectangle(canvas, box, cv::Scalar(255, 255, 255), cv::FILLED);
    cv::rectangle(canvas, box, title_color, 4);

    int y = box.y + 80;
    text.set_height(56);
    text.draw_text(canvas, stats.is_failed ? "Game Over!" : "Congratulations!", cv::Point(cx, y), title_color, true);

    const cv::Scalar body(54, 52, 45);
    text.set_height(30);
    y += 80;
    text.draw_text(canvas, "Time: " + Util::format_clock(stats.elapsed_time), cv::Point(cx, y), body, true);
    y += 50;
    text.draw_text(canvas, "Moves: " + std::to_string(stats.move_count), cv::Point(cx, y), body, true);
    y += 50;
    text.draw_text(canvas, "Completion: " + std::to_string(static_cast<int>(stats.completion_percentage)) + "%", cv::Point(cx, y), body, true);

    text.set_height(22);
    y += 60;
    text.draw_text(canvas, "Press 'N' for new game", cv::Point(cx, y), cv::Scalar(100, 100, 100), true);
    y += 36;
    text.draw_text(canvas, "Press 'ESC' to exit", cv::Point(cx, y), cv::Scalar(100, 100, 100), true);
}
