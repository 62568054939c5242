#pragma once

#include "main.hpp"

#include <string>
#include <vector>

#include <opencv2/opencv.hpp>


struct SlicedImage {
    cv::Mat fitted;
    cv::Size piece_size;

    // Row-major, each exactly piece_size
    std::vector<cv::Mat> pieces;
};

class Slicer {
public:
    static const std::vector<std::string>& supported_formats();
    static bool is_supported(const std::string& path);

    // Throws ImageError (NotFound / InvalidFormat)
    static cv::Mat load_image(const std::string& path);

    static cv::Size piece_size(const cv::Size& area, GridSize grid);

    static SlicedImage fit_and_slice(const cv::Mat& source, const cv::Size& target, GridSize grid);
    static cv::Mat fit_to_grid(const cv::Mat& source, const cv::Size& target, GridSize grid);
    static std::vector<cv::Mat> split(const cv::Mat& fitted, GridSize grid);

    static cv::Mat make_thumbnail(const cv::Mat& image, const cv::Size& max_size);
};
