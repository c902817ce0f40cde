#pragma once
#include "types.hpp"
#include "histogram.hpp"
#include <opencv2/core.hpp>

enum class ThresholdDirection {
    BELOW = 0,   // foreground = luminance <= cutoff
    ABOVE = 1    // foreground = luminance >= cutoff
};

struct ThresholdParams {
    double             percentile = 0.2;   // in [0,1]
    ThresholdDirection direction = ThresholdDirection::BELOW;
};

// Smallest luminance whose cumulative share of the histogram reaches p
// ("lower" percentile). p = 0 yields the darkest level present. Counts that
// do not add up to total are SIZE_MISMATCH.
SegError percentile_cutoff(const LuminanceHistogram& hist, double p, uint8_t& cutoff);

// CV_8UC1 mask (0/255) of pixels on the selected side of the cutoff.
// hist must have been built from grid.
SegError dynamic_threshold(const cv::Mat& grid, const LuminanceHistogram& hist,
                           const ThresholdParams& params, cv::Mat& mask);

// Three-tone posterization: dark below the lower percentile, bright above
// the upper one, mid in between.
struct TriThresholdParams {
    double    lower = 0.2;   // fraction of pixels painted dark
    double    upper = 0.2;   // fraction of pixels painted bright
    cv::Vec3b dark   = cv::Vec3b(0, 0, 0);
    cv::Vec3b mid    = cv::Vec3b(127, 127, 127);
    cv::Vec3b bright = cv::Vec3b(255, 255, 255);
};

SegError tri_threshold(const cv::Mat& grid, const TriThresholdParams& params, cv::Mat& out);
