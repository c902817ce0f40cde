#include "blob_renderer.hpp"
#include "pixel_grid.hpp"
#include "report.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
using namespace cv;
using std::vector;

SegError parse_render_mode(const std::string& text, RenderMode& mode) {
    if (text == "outline") { mode = RenderMode::OUTLINE; return SegError::NONE; }
    if (text == "fill")    { mode = RenderMode::FILL;    return SegError::NONE; }
    if (text == "heatmap") { mode = RenderMode::HEATMAP; return SegError::NONE; }
    if (text == "report")  { mode = RenderMode::REPORT;  return SegError::NONE; }
    return SegError::BAD_RENDER_MODE;
}

const char* render_mode_name(RenderMode mode) {
    switch (mode) {
    case RenderMode::OUTLINE: return "outline";
    case RenderMode::FILL:    return "fill";
    case RenderMode::HEATMAP: return "heatmap";
    case RenderMode::REPORT:  return "report";
    default:                  return "unknown";
    }
}

SegError parse_background(const std::string& text, Background& bg) {
    if (text == "original")    { bg = Background::ORIGINAL; return SegError::NONE; }
    if (text == "black")       { bg = Background::BLACK;    return SegError::NONE; }
    if (text == "transparent") { bg = Background::CLEAR;    return SegError::NONE; }
    return SegError::BAD_BACKGROUND;
}

Vec3b palette_color(int id) {
    const int64_t i = std::max(id - 1, 0);
    return Vec3b((uchar)((i * 100 + 50) % 255),
                 (uchar)((i * 50 + 100) % 255),
                 (uchar)((i * 20 + 150) % 255));
}

Vec3b heatmap_color(double t) {
    t = std::min(std::max(t, 0.0), 1.0);
    if (t < 0.8) {
        const double ratio = t / 0.8;
        return Vec3b(saturate_cast<uchar>(255.0 * ratio), 0, saturate_cast<uchar>(255.0 * (1.0 - ratio)));
    }
    const double ratio = (t - 0.8) / 0.2;
    const uchar gb = saturate_cast<uchar>(255.0 * ratio);
    return Vec3b(255, gb, gb);
}

static Mat make_canvas(const Mat& grid, Background bg) {
    switch (bg) {
    case Background::BLACK:       return make_grid(grid.cols, grid.rows, Vec4b(0, 0, 0, 255));
    case Background::CLEAR:       return Mat::zeros(grid.size(), CV_8UC4);
    default:                      return grid.clone();
    }
}

static vector<const Blob*> by_id(const vector<Blob>& blobs) {
    vector<const Blob*> order; order.reserve(blobs.size());
    for (const Blob& b : blobs) order.push_back(&b);
    std::stable_sort(order.begin(), order.end(), [](const Blob* a, const Blob* b){ return a->id < b->id; });
    return order;
}

// Paints every labeled pixel whose id has an entry in `lut`.
static void paint_members(Mat& canvas, const Mat& labels, const vector<Vec4b>& lut, const vector<char>& has) {
    const int max_id = (int)lut.size() - 1;
    for (int y = 0; y < labels.rows; ++y) {
        const int* lbl = labels.ptr<int>(y);
        Vec4b* dst = canvas.ptr<Vec4b>(y);
        for (int x = 0; x < labels.cols; ++x) {
            const int id = lbl[x];
            if (id > 0 && id <= max_id && has[id]) dst[x] = lut[id];
        }
    }
}

SegError render(const Mat& grid, const Mat& labels, const vector<Blob>& blobs,
                RenderMode mode, const RenderParams& params, RenderOutput& out) {
    out.image.release();
    out.report.clear();
    if (mode != RenderMode::OUTLINE && mode != RenderMode::FILL &&
        mode != RenderMode::HEATMAP && mode != RenderMode::REPORT)
        return SegError::BAD_RENDER_MODE;
    if (!is_valid_grid(grid)) return SegError::BAD_GRID;

    if (mode == RenderMode::REPORT) {
        out.report = blobs_to_json(blobs, grid.cols, grid.rows);
        return SegError::NONE;
    }
    if (mode != RenderMode::OUTLINE &&
        (labels.type() != CV_32SC1 || labels.size() != grid.size()))
        return SegError::SIZE_MISMATCH;

    Mat canvas = make_canvas(grid, params.background);
    const vector<const Blob*> order = by_id(blobs);

    if (mode == RenderMode::OUTLINE) {
        const Vec3b& c = params.outline_color;
        for (const Blob* b : order) {
            rectangle(canvas, Point(b->box.min_x, b->box.min_y), Point(b->box.max_x, b->box.max_y),
                      Scalar(c[0], c[1], c[2], 255), 1, LINE_8);
        }
        out.image = canvas;
        return SegError::NONE;
    }

    int max_id = 0, max_area = 0;
    for (const Blob* b : order) { max_id = std::max(max_id, b->id); max_area = std::max(max_area, b->area); }
    vector<Vec4b> lut(max_id + 1);
    vector<char> has(max_id + 1, 0);
    for (const Blob* b : order) {
        if (b->id < 1) continue;
        Vec3b c;
        if (mode == RenderMode::HEATMAP)
            c = heatmap_color(max_area > 0 ? (double)b->area / (double)max_area : 0.0);
        else
            c = params.fill == FillPolicy::SOLID ? params.fill_color : palette_color(b->id);
        lut[b->id] = Vec4b(c[0], c[1], c[2], 255);
        has[b->id] = 1;
    }
    paint_members(canvas, labels, lut, has);
    out.image = canvas;
    return SegError::NONE;
}
