#pragma once
#include "types.hpp"
#include <opencv2/core.hpp>

struct ColorMaskParams {
    cv::Vec3b target = cv::Vec3b(0, 0, 0);   // R,G,B
    double    max_distance = 0.0;            // Euclidean, in RGB units
};

// 255 where the pixel lies within max_distance of the target color.
SegError color_mask(const cv::Mat& grid, const ColorMaskParams& params, cv::Mat& mask);
