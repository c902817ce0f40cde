#include "histogram.hpp"
#include "pixel_grid.hpp"
#include <algorithm>
using namespace cv;

LuminanceHistogram build_histogram_rows(const Mat& grid, int row_begin, int row_end) {
    LuminanceHistogram h;
    if (!is_valid_grid(grid)) return h;
    row_begin = std::max(row_begin, 0);
    row_end = std::min(row_end, grid.rows);
    for (int y = row_begin; y < row_end; ++y) {
        const Vec4b* row = grid.ptr<Vec4b>(y);
        for (int x = 0; x < grid.cols; ++x)
            ++h.counts[luminance(row[x][0], row[x][1], row[x][2])];
    }
    if (row_end > row_begin) h.total = (uint64_t)(row_end - row_begin) * (uint64_t)grid.cols;
    return h;
}

LuminanceHistogram build_histogram(const Mat& grid) {
    return build_histogram_rows(grid, 0, grid.rows);
}

void merge_histogram(LuminanceHistogram& into, const LuminanceHistogram& part) {
    for (int i = 0; i < 256; ++i) into.counts[i] += part.counts[i];
    into.total += part.total;
}
