#include <gtest/gtest.h>

#include "slicer.hpp"
#include "image_error.hpp"

#include <fstream>
#include <filesystem>

#include <opencv2/opencv.hpp>

namespace {

const cv::Vec3b kRed(0, 0, 255);
const cv::Vec3b kGreen(0, 255, 0);
const cv::Vec3b kBlue(255, 0, 0);
const cv::Vec3b kWhite(255, 255, 255);

std::filesystem::path temp_dir() {
    auto dir = std::filesystem::temp_directory_path() / "reassemble_slicer_test";
    std::filesystem::create_directories(dir);
    return dir;
}

cv::Mat three_bands(int w, int h, bool vertical) {
    cv::Mat img(h, w, CV_8UC3);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            int band = vertical ? (3 * x / w) : (3 * y / h);
            img.at<cv::Vec3b>(y, x) = band == 0 ? kRed : band == 1 ? kGreen : kBlue;
        }
    }
    return img;
}

} // namespace

TEST(SlicerTest, PieceCountAndSizeForManyGrids) {
    cv::Mat source(400, 600, CV_8UC3, cv::Scalar(10, 20, 30));
    const std::vector<GridSize> grids{{1, 1}, {2, 3}, {3, 3}, {3, 4}, {4, 5}, {5, 5}, {7, 2}};
    const std::vector<cv::Size> targets{{870, 860}, {101, 99}, {640, 480}, {333, 777}};

    for (const auto& grid : grids) {
        for (const auto& target : targets) {
            SlicedImage sliced = Slicer::fit_and_slice(source, target, grid);

            const int pw = target.width / grid.cols;
            const int ph = target.height / grid.rows;

            ASSERT_EQ(static_cast<int>(sliced.pieces.size()), grid.count());
            EXPECT_EQ(sliced.piece_size, cv::Size(pw, ph));
            EXPECT_EQ(sliced.fitted.cols, pw * grid.cols);
            EXPECT_EQ(sliced.fitted.rows, ph * grid.rows);

            for (const auto& piece : sliced.pieces) {
                EXPECT_EQ(piece.size(), cv::Size(pw, ph));
            }
        }
    }
}

TEST(SlicerTest, RemainderIsDiscarded) {
    cv::Mat source(100, 100, CV_8UC3, cv::Scalar::all(0));
    SlicedImage sliced = Slicer::fit_and_slice(source, cv::Size(100, 100), GridSize{3, 3});

    EXPECT_EQ(sliced.piece_size, cv::Size(33, 33));
    EXPECT_EQ(sliced.fitted.size(), cv::Size(99, 99));
}

TEST(SlicerTest, WiderSourceIsCroppedLeftAndRight) {
    // Scale 1:1 by height, keep the middle third
    cv::Mat source = three_bands(300, 100, true);
    cv::Mat fitted = Slicer::fit_to_grid(source, cv::Size(100, 100), GridSize{1, 1});

    ASSERT_EQ(fitted.size(), cv::Size(100, 100));
    EXPECT_EQ(fitted.at<cv::Vec3b>(0, 0), kGreen);
    EXPECT_EQ(fitted.at<cv::Vec3b>(50, 50), kGreen);
    EXPECT_EQ(fitted.at<cv::Vec3b>(99, 99), kGreen);
}

TEST(SlicerTest, TallerSourceIsCroppedTopAndBottom) {
    cv::Mat source = three_bands(100, 300, false);
    cv::Mat fitted = Slicer::fit_to_grid(source, cv::Size(100, 100), GridSize{1, 1});

    ASSERT_EQ(fitted.size(), cv::Size(100, 100));
    EXPECT_EQ(fitted.at<cv::Vec3b>(0, 0), kGreen);
    EXPECT_EQ(fitted.at<cv::Vec3b>(99, 50), kGreen);
}

TEST(SlicerTest, PiecesAreRowMajor) {
    cv::Mat source(200, 200, CV_8UC3);
    source(cv::Rect(0, 0, 100, 100)).setTo(cv::Scalar(0, 0, 255));
    source(cv::Rect(100, 0, 100, 100)).setTo(cv::Scalar(0, 255, 0));
    source(cv::Rect(0, 100, 100, 100)).setTo(cv::Scalar(255, 0, 0));
    source(cv::Rect(100, 100, 100, 100)).setTo(cv::Scalar(255, 255, 255));

    SlicedImage sliced = Slicer::fit_and_slice(source, cv::Size(200, 200), GridSize{2, 2});
    ASSERT_EQ(sliced.pieces.size(), 4u);

    EXPECT_EQ(sliced.pieces[0].at<cv::Vec3b>(50, 50), kRed);
    EXPECT_EQ(sliced.pieces[1].at<cv::Vec3b>(50, 50), kGreen);
    EXPECT_EQ(sliced.pieces[2].at<cv::Vec3b>(50, 50), kBlue);
    EXPECT_EQ(sliced.pieces[3].at<cv::Vec3b>(50, 50), kWhite);
}

TEST(SlicerTest, PiecesOwnTheirPixels) {
    cv::Mat source(120, 120, CV_8UC3, cv::Scalar(1, 2, 3));
    SlicedImage sliced = Slicer::fit_and_slice(source, cv::Size(120, 120), GridSize{2, 2});

    for (const auto& piece : sliced.pieces) {
        EXPECT_FALSE(piece.isSubmatrix());
    }

    sliced.pieces[0].setTo(cv::Scalar(9, 9, 9));
    EXPECT_EQ(sliced.fitted.at<cv::Vec3b>(0, 0), cv::Vec3b(1, 2, 3));
}

TEST(SlicerTest, RejectsBadGeometry) {
    cv::Mat source(50, 50, CV_8UC3, cv::Scalar::all(0));

    EXPECT_THROW(Slicer::fit_and_slice(source, cv::Size(100, 100), GridSize{0, 3}), std::invalid_argument);
    EXPECT_THROW(Slicer::fit_and_slice(source, cv::Size(2, 2), GridSize{3, 3}), std::invalid_argument);
}

TEST(SlicerTest, EmptySourceIsInvalidFormat) {
    try {
        Slicer::fit_and_slice(cv::Mat(), cv::Size(100, 100), GridSize{2, 2});
        FAIL() << "expected ImageError";
    }
    catch (const ImageError& e) {
        EXPECT_EQ(e.kind(), ImageError::Kind::InvalidFormat);
    }
}

TEST(SlicerTest, LoadImageMissingFileIsNotFound) {
    auto path = (temp_dir() / "does_not_exist.png").string();
    try {
        Slicer::load_image(path);
        FAIL() << "expected ImageError";
    }
    catch (const ImageError& e) {
        EXPECT_EQ(e.kind(), ImageError::Kind::NotFound);
    }
}

TEST(SlicerTest, LoadImageUnsupportedOrCorruptIsInvalidFormat) {
    auto text_path = temp_dir() / "notes.txt";
    auto corrupt_path = temp_dir() / "corrupt.png";
    std::ofstream(text_path) << "hello";
    std::ofstream(corrupt_path, std::ios::binary) << "definitely not a png";

    for (const auto& path : {text_path, corrupt_path}) {
        try {
            Slicer::load_image(path.string());
            FAIL() << "expected ImageError for " << path;
        }
        catch (const ImageError& e) {
            EXPECT_EQ(e.kind(), ImageError::Kind::InvalidFormat);
        }
    }
}

TEST(SlicerTest, LoadImageReadsSupportedFormat) {
    auto path = (temp_dir() / "sample.png").string();
    cv::Mat img(30, 40, CV_8UC3, cv::Scalar(5, 6, 7));
    ASSERT_TRUE(cv::imwrite(path, img));

    cv::Mat loaded = Slicer::load_image(path);
    EXPECT_EQ(loaded.size(), img.size());
    EXPECT_EQ(loaded.type(), CV_8UC3);
    EXPECT_EQ(loaded.at<cv::Vec3b>(10, 10), cv::Vec3b(5, 6, 7));
}

TEST(SlicerTest, SupportedExtensionsIgnoreCase) {
    EXPECT_TRUE(Slicer::is_supported("photo.JPG"));
    EXPECT_TRUE(Slicer::is_supported("dir/photo.jpeg"));
    EXPECT_TRUE(Slicer::is_supported("photo.Bmp"));
    EXPECT_FALSE(Slicer::is_supported("photo.gif"));
    EXPECT_FALSE(Slicer::is_supported("photo"));
}

TEST(SlicerTest, ThumbnailFitsAndKeepsAspect) {
    cv::Mat img(300, 600, CV_8UC3, cv::Scalar::all(0));
    cv::Mat thumb = Slicer::make_thumbnail(img, cv::Size(180, 180));

    EXPECT_EQ(thumb.cols, 180);
    EXPECT_EQ(thumb.rows, 90);

    cv::Mat small(20, 20, CV_8UC3, cv::Scalar::all(0));
    EXPECT_EQ(Slicer::make_thumbnail(small, cv::Size(180, 180)).size(), cv::Size(20, 20));
    EXPECT_TRUE(Slicer::make_thumbnail(img, cv::Size(0, 10)).empty());
}
