#include "dynamic_threshold.hpp"
#include "pixel_grid.hpp"
#include <cmath>
#include <algorithm>
using namespace cv;

static bool in_unit_range(double v) {
    return !std::isnan(v) && v >= 0.0 && v <= 1.0;
}

SegError percentile_cutoff(const LuminanceHistogram& hist, double p, uint8_t& cutoff) {
    if (!in_unit_range(p) || hist.total == 0) return SegError::BAD_PERCENTILE;
    const double total = (double)hist.total;
    uint64_t running = 0;
    for (int level = 0; level < 256; ++level) {
        if (hist.counts[level] == 0) continue;
        running += hist.counts[level];
        // running / total, not running >= p * total: the product rounds up past
        // exact counts (0.07 * 100 > 7).
        if ((double)running / total >= p) { cutoff = (uint8_t)level; return SegError::NONE; }
    }
    // Counts do not add up to total.
    return SegError::SIZE_MISMATCH;
}

SegError dynamic_threshold(const Mat& grid, const LuminanceHistogram& hist,
                           const ThresholdParams& params, Mat& mask) {
    mask.release();
    if (!in_unit_range(params.percentile)) return SegError::BAD_PERCENTILE;
    if (!is_valid_grid(grid)) return SegError::BAD_GRID;
    if (hist.total != (uint64_t)grid.total()) return SegError::SIZE_MISMATCH;

    uint8_t cutoff = 0;
    SegError se = percentile_cutoff(hist, params.percentile, cutoff);
    if (se != SegError::NONE) return se;

    const bool below = params.direction == ThresholdDirection::BELOW;
    Mat out(grid.size(), CV_8UC1);
    for (int y = 0; y < grid.rows; ++y) {
        const Vec4b* src = grid.ptr<Vec4b>(y);
        uchar* dst = out.ptr<uchar>(y);
        for (int x = 0; x < grid.cols; ++x) {
            uint8_t l = luminance(src[x][0], src[x][1], src[x][2]);
            bool fg = below ? (l <= cutoff) : (l >= cutoff);
            dst[x] = fg ? 255 : 0;
        }
    }
    mask = out;
    return SegError::NONE;
}

SegError tri_threshold(const Mat& grid, const TriThresholdParams& params, Mat& out) {
    out.release();
    if (!in_unit_range(params.lower) || !in_unit_range(params.upper)) return SegError::BAD_PERCENTILE;
    if (!is_valid_grid(grid)) return SegError::BAD_GRID;

    LuminanceHistogram hist = build_histogram(grid);
    const uint64_t total = hist.total;
    const uint64_t dark_count   = std::min<uint64_t>((uint64_t)std::llround((double)total * params.lower), total);
    const uint64_t bright_count = std::min<uint64_t>((uint64_t)std::llround((double)total * (1.0 - params.upper)), total);

    uint64_t cumulative = 0;
    int t_dark = 0, t_bright = 255;
    bool dark_found = false, bright_found = false;
    for (int level = 0; level < 256 && !(dark_found && bright_found); ++level) {
        const uint64_t at = hist.counts[level];
        if (!dark_found && cumulative + at >= dark_count)     { t_dark = level;   dark_found = true; }
        if (!bright_found && cumulative + at >= bright_count) { t_bright = level; bright_found = true; }
        cumulative += at;
    }
    // Keep a non-empty mid band between the two cutoffs.
    if (t_bright <= t_dark) {
        if (t_dark > 0) --t_dark;
        else if (t_bright < 255) ++t_bright;
    }

    Mat res(grid.size(), CV_8UC4);
    for (int y = 0; y < grid.rows; ++y) {
        const Vec4b* src = grid.ptr<Vec4b>(y);
        Vec4b* dst = res.ptr<Vec4b>(y);
        for (int x = 0; x < grid.cols; ++x) {
            const int l = luminance(src[x][0], src[x][1], src[x][2]);
            const Vec3b& c = l <= t_dark ? params.dark : (l >= t_bright ? params.bright : params.mid);
            dst[x] = Vec4b(c[0], c[1], c[2], 255);
        }
    }
    out = res;
    return SegError::NONE;
}
