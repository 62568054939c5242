#pragma once

#include <cmath>
#include <cctype>
#include <cstdio>
#include <limits>
#include <string>
#include <optional>
#include <algorithm>

#include "main.hpp"

class Util {
public:
    template<typename T>
    static constexpr T clamp(const T& v, const T& lo, const T& hi) {
        return (v < lo) ? lo : (v > hi) ? hi : v;
    }

    static double distance(const std::optional<cv::Point>& from, const cv::Point& to) {
        if (!from) {
            return std::numeric_limits<double>::infinity();
        }
        double dx = from->x - to.x;
        double dy = from->y - to.y;
        return std::sqrt(dx * dx + dy * dy);
    }

    static std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    static std::string format_clock(double seconds) {
        int total = static_cast<int>(seconds);
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%02d:%02d", total / 60, total % 60);
        return buf;
    }

    static const char* mode_name(GameMode mode) {
        switch (mode) {
            case GameMode::Timed:     return "timed";
            case GameMode::Challenge: return "challenge";
            default:                  return "free";
        }
    }

    static std::optional<GameMode> parse_mode(const std::string& name) {
        std::string n = to_lower(name);
        if (n == "free" || n == "creative") return GameMode::Free;
        if (n == "timed") return GameMode::Timed;
        if (n == "challenge") return GameMode::Challenge;
        return std::nullopt;
    }

    // Accepts "3x4" or "3X4"
    static std::optional<GridSize> parse_grid(const std::string& text) {
        int rows = 0, cols = 0;
        char sep = 0;
        if (std::sscanf(text.c_str(), "%d%c%d", &rows, &sep, &cols) != 3 || (sep != 'x' && sep != 'X')) {
            return std::nullopt;
        }
        GridSize grid{rows, cols};
        if (!grid.valid()) {
            return std::nullopt;
        }
        return grid;
    }
};
