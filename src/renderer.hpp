#pragma once

#include "main.hpp"
#include "text_renderer.hpp"

#include <string>

#include <opencv2/opencv.hpp>

// Theme colors (BGR)
const cv::Scalar BACKGROUND_COLOR(54, 52, 45);
const cv::Scalar PLAY_AREA_BG(114, 110, 99);
const cv::Scalar STAGING_AREA_BG(195, 190, 178);
const cv::Scalar INFO_AREA_BG(75, 70, 60);
const cv::Scalar GRID_LINE_COLOR(200, 200, 200);
const cv::Scalar TEXT_COLOR(255, 255, 255);
const cv::Scalar HINT_COLOR(150, 150, 150);
const cv::Scalar ACCENT_COLOR(219, 152, 52);
const cv::Scalar FAILURE_COLOR(60, 76, 231);

constexpr int GRID_LINE_WIDTH = 2;
constexpr int SHADOW_OFFSET = 5;

class Renderer {
public:
    Renderer(TextRenderer& text, const cv::Size& window);

    cv::Mat render(const FrameSnapshot& frame);

    static void blit(cv::Mat& canvas, const cv::Mat& image, const cv::Point& pos);

private:
    void draw_play_area(cv::Mat& canvas, const FrameSnapshot& frame);
    void draw_staging_area(cv::Mat& canvas, const FrameSnapshot& frame);
    void draw_piece(cv::Mat& canvas, const PieceView& piece);
    void draw_preview(cv::Mat& canvas, const FrameSnapshot& frame);
    void draw_info_panel(cv::Mat& canvas, const FrameSnapshot& frame);
    void draw_completion_overlay(cv::Mat& canvas, const SessionStats& stats);

    TextRenderer& text;
    cv::Size window;
};
