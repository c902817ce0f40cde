#include "mask_source.hpp"
#include "pixel_grid.hpp"
#include <cmath>

SegError ThresholdMaskSource::build(const cv::Mat& grid, cv::Mat& mask) const {
    mask.release();
    const double p = m_params.percentile;
    if (std::isnan(p) || p < 0.0 || p > 1.0) return SegError::BAD_PERCENTILE;
    if (!is_valid_grid(grid)) return SegError::BAD_GRID;
    return dynamic_threshold(grid, build_histogram(grid), m_params, mask);
}

SegError ColorMaskSource::build(const cv::Mat& grid, cv::Mat& mask) const {
    return color_mask(grid, m_params, mask);
}
