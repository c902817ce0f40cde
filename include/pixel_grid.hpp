#pragma once
#include "types.hpp"
#include <opencv2/core.hpp>
#include <string>

// A PixelGrid is a CV_8UC4 cv::Mat in R,G,B,A order (not OpenCV's BGR).
// The core never writes into a grid it was handed.

cv::Mat make_grid(int width, int height, const cv::Vec4b& rgba = cv::Vec4b(0, 0, 0, 255));
bool    is_valid_grid(const cv::Mat& grid);

// Codec adapter: decoded 8-bit gray/BGR/BGRA image <-> RGBA grid.
SegError grid_from_cv(const cv::Mat& decoded, cv::Mat& grid);
cv::Mat  grid_to_cv(const cv::Mat& grid);

SegError read_grid(const std::string& path, cv::Mat& grid);
bool     write_grid(const std::string& path, const cv::Mat& grid);

// round(0.299 R + 0.587 G + 0.114 B), exact in integer arithmetic.
inline uint8_t luminance(uint8_t r, uint8_t g, uint8_t b) {
    return (uint8_t)((299u * r + 587u * g + 114u * b + 500u) / 1000u);
}

// "#RRGGBB" or "RRGGBB", any case.
SegError parse_hex_color(const std::string& text, cv::Vec3b& rgb);

// Whole decimal number in int range ("8", "-1", "1e3"); false for fractions,
// NaN, overflow or trailing text.
bool parse_int(const std::string& text, int& value);
