#include "slicer.hpp"

#include "util.hpp"
#include "image_error.hpp"

#include <string>
#include <vector>
#include <cstdint>
#include <algorithm>
#include <stdexcept>
#include <filesystem>

#include <opencv2/opencv.hpp>


const std::vector<std::string>& Slicer::supported_formats() {
    static const std::vector<std::string> formats{".png", ".jpg", ".jpeg", ".bmp"};
    return formats;
}

bool Slicer::is_supported(const std::string& path) {
    std::string ext = Util::to_lower(std::filesystem::path(path).extension().string());
    const auto& formats = supported_formats();
    return std::find(formats.begin(), formats.end(), ext) != formats.end();
}

cv::Mat Slicer::load_image(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw ImageError::not_found(path);
    }

    if (!is_supported(path)) {
        throw ImageError::invalid_format(path);
    }

    cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
    if (image.empty()) {
        throw ImageError::invalid_format(path);
    }
    return image;
}

cv::Size Slicer::piece_size(const cv::Size& area, GridSize grid) {
    if (!grid.valid()) {
        throw std::invalid_argument("Grid must have at least one row and one column");
    }
    return cv::Size(area.width / grid.cols, area.height / grid.rows);
}

cv::Mat Slicer::fit_to_grid(const cv::Mat& source, const cv::Size& target, GridSize grid) {
    if (source.empty()) {
        throw ImageError(ImageError::Kind::InvalidFormat, "Source image is empty");
    }

    cv::Size piece = piece_size(target, grid);
    if (piece.width <= 0 || piece.height <= 0) {
        throw std::invalid_argument("Target area is too small for a " + std::to_string(grid.rows) + "x" + std::to_string(grid.cols) + " grid");
    }

    int final_w = piece.width * grid.cols;
    int final_h = piece.height * grid.rows;

    // Compare source and target aspect ratios without rounding
    int64_t lhs = static_cast<int64_t>(source.cols) * final_h;
    int64_t rhs = static_cast<int64_t>(final_w) * source.rows;

    cv::Mat scaled;
    cv::Rect crop;

    if (lhs > rhs) {
        // Source is wider: match heights and trim the sides
        int new_w = static_cast<int>(static_cast<int64_t>(source.cols) * final_h / source.rows);
        new_w = std::max(new_w, final_w);
        cv::resize(source, scaled, cv::Size(new_w, final_h), 0, 0, cv::INTER_LANCZOS4);
        crop = cv::Rect((new_w - final_w) / 2, 0, final_w, final_h);
    }
    else {
        // Source is taller (or same ratio): match widths and trim top/bottom
        int new_h = static_cast<int>(static_cast<int64_t>(source.rows) * final_w / source.cols);
        new_h = std::max(new_h, final_h);
        cv::resize(source, scaled, cv::Size(final_w, new_h), 0, 0, cv::INTER_LANCZOS4);
        crop = cv::Rect(0, (new_h - final_h) / 2, final_w, final_h);
    }

    return scaled(crop).clone();
}

std::vector<cv::Mat> Slicer::split(const cv::Mat& fitted, GridSize grid) {
    cv::Size piece = piece_size(fitted.size(), grid);
    std::vector<cv::Mat> pieces;
    pieces.reserve(grid.count());

    for (int row = 0; row < grid.rows; ++row) {
        for (int col = 0; col < grid.cols; ++col) {
            cv::Rect rect(col * piece.width, row * piece.height, piece.width, piece.height);
            pieces.push_back(fitted(rect).clone());
        }
    }
    return pieces;
}

SlicedImage Slicer::fit_and_slice(const cv::Mat& source, const cv::Size& target, GridSize grid) {
    SlicedImage sliced;
    sliced.fitted = fit_to_grid(source, target, grid);
    sliced.piece_size = piece_size(sliced.fitted.size(), grid);
    sliced.pieces = split(sliced.fitted, grid);
    return sliced;
}

cv::Mat Slicer::make_thumbnail(const cv::Mat& image, const cv::Size& max_size) {
    if (image.empty() || max_size.width <= 0 || max_size.height <= 0) {
        return cv::Mat();
    }

    double scale = std::min(static_cast<double>(max_size.width) / image.cols, static_cast<double>(max_size.height) / image.rows);
    scale = std::min(scale, 1.0);

    int w = std::max(1, static_cast<int>(image.cols * scale));
    int h = std::max(1, static_cast<int>(image.rows * scale));

    cv::Mat thumb;
    cv::resize(image, thumb, cv::Size(w, h), 0, 0, cv::INTER_AREA);
    return thumb;
}
