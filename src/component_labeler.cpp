#include "component_labeler.hpp"
#include "union_find.hpp"
#include "pixel_grid.hpp"
#include <algorithm>
#include <iostream>
using namespace cv;
using std::vector;

namespace {

// Running statistics of one resolved component.
struct BlobAccumulator {
    int64_t  area = 0;
    int64_t  sum_x = 0, sum_y = 0;
    int      min_x = 0, min_y = 0, max_x = 0, max_y = 0;
    uint64_t sum_r = 0, sum_g = 0, sum_b = 0;

    void start(int x, int y) { min_x = max_x = x; min_y = max_y = y; }
    void add(int x, int y) {
        ++area; sum_x += x; sum_y += y;
        min_x = std::min(min_x, x); max_x = std::max(max_x, x);
        min_y = std::min(min_y, y); max_y = std::max(max_y, y);
    }
};

uchar mean_channel(uint64_t sum, int64_t area) {
    return (uchar)((sum + (uint64_t)area / 2) / (uint64_t)area);
}

// First pass: provisional labels written into `labels`, equivalences into `ds`.
void provisional_pass(const Mat& mask, bool eight, Mat& labels, DisjointSet& ds) {
    ds.make_set(); // 0 is background
    for (int y = 0; y < mask.rows; ++y) {
        const uchar* m = mask.ptr<uchar>(y);
        int* cur = labels.ptr<int>(y);
        const int* up = y > 0 ? labels.ptr<int>(y - 1) : nullptr;
        for (int x = 0; x < mask.cols; ++x) {
            if (!m[x]) continue;
            int nb[4]; int n = 0;
            if (x > 0 && cur[x - 1]) nb[n++] = cur[x - 1];
            if (up) {
                if (up[x]) nb[n++] = up[x];
                if (eight) {
                    if (x > 0 && up[x - 1]) nb[n++] = up[x - 1];
                    if (x + 1 < mask.cols && up[x + 1]) nb[n++] = up[x + 1];
                }
            }
            if (n == 0) { cur[x] = ds.make_set(); continue; }
            const int lbl = *std::min_element(nb, nb + n);
            cur[x] = lbl;
            for (int i = 0; i < n; ++i)
                if (nb[i] != lbl) ds.unite(lbl, nb[i]);
        }
    }
}

} // namespace

SegError label_components(const Mat& mask, const Mat& grid,
                          const LabelingParams& params, Labeling& out) {
    out.labels.release();
    out.blobs.clear();
    if (params.connectivity != 4 && params.connectivity != 8) return SegError::BAD_CONNECTIVITY;
    if (params.min_area < 0) return SegError::BAD_MIN_AREA;
    if (mask.empty() || mask.type() != CV_8UC1) return SegError::BAD_GRID;
    const bool with_color = !grid.empty();
    if (with_color) {
        if (!is_valid_grid(grid)) return SegError::BAD_GRID;
        if (grid.size() != mask.size()) return SegError::SIZE_MISMATCH;
    }

    Mat labels(mask.size(), CV_32SC1, Scalar(0));
    DisjointSet ds(64);
    provisional_pass(mask, params.connectivity == 8, labels, ds);
    const int provisional = ds.size() - 1;

    // Second pass: resolve to roots, number roots in order of first
    // appearance and accumulate statistics in the same sweep.
    vector<int> slot_of(ds.size(), -1);
    vector<BlobAccumulator> acc;
    for (int y = 0; y < labels.rows; ++y) {
        int* row = labels.ptr<int>(y);
        const Vec4b* px = with_color ? grid.ptr<Vec4b>(y) : nullptr;
        for (int x = 0; x < labels.cols; ++x) {
            if (!row[x]) continue;
            int& slot = slot_of[ds.find(row[x])];
            if (slot < 0) {
                slot = (int)acc.size();
                acc.emplace_back();
                acc.back().start(x, y);
            }
            BlobAccumulator& a = acc[slot];
            a.add(x, y);
            if (px) { a.sum_r += px[x][0]; a.sum_g += px[x][1]; a.sum_b += px[x][2]; }
            row[x] = slot + 1;
        }
    }

    vector<int> remap(acc.size() + 1, 0);
    bool dropped = false;
    out.blobs.reserve(acc.size());
    for (size_t i = 0; i < acc.size(); ++i) {
        const BlobAccumulator& a = acc[i];
        if (a.area < params.min_area) { dropped = true; continue; }
        Blob b;
        b.id = (int)out.blobs.size() + 1;
        b.area = (int)a.area;
        b.box = BlobBox{ a.min_x, a.min_y, a.max_x, a.max_y };
        b.centroid = Point2d((double)a.sum_x / (double)a.area, (double)a.sum_y / (double)a.area);
        if (with_color)
            b.color = Vec3b(mean_channel(a.sum_r, a.area), mean_channel(a.sum_g, a.area), mean_channel(a.sum_b, a.area));
        remap[i + 1] = b.id;
        out.blobs.push_back(b);
    }

    if (dropped) {
        for (int y = 0; y < labels.rows; ++y) {
            int* row = labels.ptr<int>(y);
            for (int x = 0; x < labels.cols; ++x) row[x] = remap[row[x]];
        }
    }
    out.labels = labels;

    if (params.debug) {
        std::cout << "[labeler] provisional=" << provisional
                  << " components=" << acc.size()
                  << " kept=" << out.blobs.size()
                  << " (connectivity " << params.connectivity
                  << ", min_area " << params.min_area << ")\n";
    }
    return SegError::NONE;
}
