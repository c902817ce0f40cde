#include "color_mask.hpp"
#include "pixel_grid.hpp"
#include <cmath>
using namespace cv;

SegError color_mask(const Mat& grid, const ColorMaskParams& params, Mat& mask) {
    mask.release();
    if (std::isnan(params.max_distance) || params.max_distance < 0.0) return SegError::BAD_DISTANCE;
    if (!is_valid_grid(grid)) return SegError::BAD_GRID;

    // Squared distances are integers; compare against floor(D^2) exactly.
    const double d2 = params.max_distance * params.max_distance;
    const int64_t limit = d2 >= 3.0 * 255 * 255 ? INT64_C(3) * 255 * 255 : (int64_t)std::floor(d2);
    const Vec3b& t = params.target;

    Mat out(grid.size(), CV_8UC1);
    for (int y = 0; y < grid.rows; ++y) {
        const Vec4b* src = grid.ptr<Vec4b>(y);
        uchar* dst = out.ptr<uchar>(y);
        for (int x = 0; x < grid.cols; ++x) {
            const int dr = (int)src[x][0] - t[0];
            const int dg = (int)src[x][1] - t[1];
            const int db = (int)src[x][2] - t[2];
            dst[x] = (int64_t)(dr * dr + dg * dg + db * db) <= limit ? 255 : 0;
        }
    }
    mask = out;
    return SegError::NONE;
}
