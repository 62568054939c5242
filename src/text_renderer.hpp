#pragma once

#include <string>
#include <vector>
#include <cstdint>

#include <ft2build.h>
#include FT_FREETYPE_H
#include <opencv2/opencv.hpp>


class TextRenderer {
public:
    explicit TextRenderer(const std::string& font_path, int font_height = 32);
    ~TextRenderer();

    TextRenderer(const TextRenderer&) = delete;
    TextRenderer& operator=(const TextRenderer&) = delete;

    static std::vector<uint32_t> utf8_to_codepoints(const std::string& utf8);

    void set_height(int pixels);
    int text_width(const std::string& text);

    // Draws UTF-8 text with its baseline at org, optionally centered on org.x
    void draw_text(cv::Mat& img, const std::string& text, cv::Point org, const cv::Scalar& color, bool center = false);

private:
    FT_Library ftlib = nullptr;
    FT_Face face = nullptr;
    int height = 32;
};
