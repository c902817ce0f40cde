#include "pixel_grid.hpp"
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>
#include <cctype>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
using namespace cv;

Mat make_grid(int width, int height, const Vec4b& rgba) {
    return Mat(height, width, CV_8UC4, Scalar(rgba[0], rgba[1], rgba[2], rgba[3]));
}

bool is_valid_grid(const Mat& grid) {
    return !grid.empty() && grid.type() == CV_8UC4 && grid.dims == 2;
}

SegError grid_from_cv(const Mat& decoded, Mat& grid) {
    grid.release();
    if (decoded.empty() || decoded.depth() != CV_8U) return SegError::BAD_GRID;
    switch (decoded.channels()) {
    case 1: cvtColor(decoded, grid, COLOR_GRAY2RGBA); break;
    case 3: cvtColor(decoded, grid, COLOR_BGR2RGBA);  break;
    case 4: cvtColor(decoded, grid, COLOR_BGRA2RGBA); break;
    default: return SegError::BAD_GRID;
    }
    return SegError::NONE;
}

Mat grid_to_cv(const Mat& grid) {
    Mat bgra; cvtColor(grid, bgra, COLOR_RGBA2BGRA); return bgra;
}

SegError read_grid(const std::string& path, Mat& grid) {
    Mat img = imread(path, IMREAD_UNCHANGED);
    if (img.empty()) { grid.release(); return SegError::BAD_GRID; }
    // 16-bit PNG/TIFF input is reduced to 8 bits per channel.
    if (img.depth() == CV_16U) img.convertTo(img, CV_8U, 1.0 / 257.0);
    return grid_from_cv(img, grid);
}

bool write_grid(const std::string& path, const Mat& grid) {
    if (!is_valid_grid(grid)) return false;
    try {
        return imwrite(path, grid_to_cv(grid));
    }
    catch (const cv::Exception& e) {
        std::cerr << "[warn] imwrite " << path << ": " << e.what() << "\n";
        return false;
    }
}

static int hex_digit(char c) {
    c = (char)std::tolower((unsigned char)c);
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    return -1;
}

SegError parse_hex_color(const std::string& text, Vec3b& rgb) {
    std::string hex = text;
    if (!hex.empty() && hex[0] == '#') hex.erase(0, 1);
    if (hex.size() != 6) return SegError::BAD_COLOR;
    for (int c = 0; c < 3; ++c) {
        int hi = hex_digit(hex[2 * c]), lo = hex_digit(hex[2 * c + 1]);
        if (hi < 0 || lo < 0) return SegError::BAD_COLOR;
        rgb[c] = (uchar)(hi * 16 + lo);
    }
    return SegError::NONE;
}

bool parse_int(const std::string& text, int& value) {
    double v = 0.0;
    try {
        size_t used = 0;
        v = std::stod(text, &used);
        if (used != text.size()) return false;
    }
    catch (const std::exception&) {
        return false;
    }
    if (!(v >= (double)std::numeric_limits<int>::min() && v <= (double)std::numeric_limits<int>::max()))
        return false;
    if (v != std::floor(v)) return false;
    value = (int)v;
    return true;
}
