#include "text_renderer.hpp"

#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>

#include <ft2build.h>
#include FT_FREETYPE_H
#include <opencv2/opencv.hpp>


TextRenderer::TextRenderer(const std::string& font_path, int font_height) : height(font_height) {
    if (FT_Init_FreeType(&ftlib)) {
        throw std::runtime_error("Failed to initialize FreeType");
    }

    if (FT_New_Face(ftlib, font_path.c_str(), 0, &face)) {
        FT_Done_FreeType(ftlib);
        throw std::runtime_error("Failed to load font: " + font_path);
    }

    set_height(font_height);
}

TextRenderer::~TextRenderer() {
    if (face) FT_Done_Face(face);
    if (ftlib) FT_Done_FreeType(ftlib);
}

// Malformed sequences are skipped a byte at a time
std::vector<uint32_t> TextRenderer::utf8_to_codepoints(const std::string& utf8) {
    std::vector<uint32_t> codepoints;
    size_t i = 0;

    auto cont = [&](size_t k) -> uint32_t {
        return (i + k < utf8.size()) ? (static_cast<unsigned char>(utf8[i + k]) & 0x3F) : 0;
    };

    while (i < utf8.size()) {
        unsigned char c = utf8[i];
        if (c < 0x80) {
            codepoints.push_back(c);
            i += 1;
        }
        else if ((c & 0xE0) == 0xC0) {
            codepoints.push_back(((c & 0x1F) << 6) | cont(1));
            i += 2;
        }
        else if ((c & 0xF0) == 0xE0) {
            codepoints.push_back(((c & 0x0F) << 12) | (cont(1) << 6) | cont(2));
            i += 3;
        }
        else if ((c & 0xF8) == 0xF0) {
            codepoints.push_back(((c & 0x07) << 18) | (cont(1) << 12) | (cont(2) << 6) | cont(3));
            i += 4;
        }
        else {
            i += 1;
        }
    }
    return codepoints;
}

void TextRenderer::set_height(int pixels) {
    height = pixels;
    FT_Set_Pixel_Sizes(face, 0, height);
}

int TextRenderer::text_width(const std::string& text) {
    int width = 0;
    for (auto cp : utf8_to_codepoints(text)) {
        if (FT_Load_Char(face, cp, FT_LOAD_DEFAULT)) continue;
        width += (face->glyph->advance.x >> 6);
    }
    return width;
}

void TextRenderer::draw_text(cv::Mat& img, const std::string& text, cv::Point org, const cv::Scalar& color, bool center) {
    int x = center ? org.x - text_width(text) / 2 : org.x;

    for (auto cp : utf8_to_codepoints(text)) {
        if (FT_Load_Char(face, cp, FT_LOAD_RENDER)) continue;

        FT_GlyphSlot slot = face->glyph;
        int y = org.y - slot->bitmap_top;
        int w = slot->bitmap.width, h = slot->bitmap.rows;

        for (int row = 0; row < h; ++row) {
            for (int col = 0; col < w; ++col) {
                int px = x + slot->bitmap_left + col;
                int py = y + row;

                if (px < 0 || py < 0 || px >= img.cols || py >= img.rows) {
                    continue;
                }

                uchar alpha = slot->bitmap.buffer[row * slot->bitmap.pitch + col];
                cv::Vec3b& dst = img.at<cv::Vec3b>(py, px);
                for (int c = 0; c < 3; ++c) {
                    dst[c] = static_cast<uchar>((dst[c] * (255 - alpha) + color[c] * alpha) / 255);
                }
            }
        }
        x += (slot->advance.x >> 6);
    }
}
