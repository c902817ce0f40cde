#pragma once
#include <opencv2/core.hpp>
#include <array>
#include <cstdint>

// 256-bucket luminance distribution. Invariant: sum(counts) == total.
struct LuminanceHistogram {
    std::array<uint32_t, 256> counts{};
    uint64_t total = 0;
};

// One pass over a valid RGBA grid; alpha does not contribute. Any other
// matrix yields an empty histogram (total 0).
LuminanceHistogram build_histogram(const cv::Mat& grid);

// Rows [row_begin, row_end) only. Partial histograms of disjoint row ranges
// merge into the whole-grid histogram.
LuminanceHistogram build_histogram_rows(const cv::Mat& grid, int row_begin, int row_end);
void merge_histogram(LuminanceHistogram& into, const LuminanceHistogram& part);
