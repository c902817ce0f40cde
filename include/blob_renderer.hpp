#pragma once
#include "types.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

enum class RenderMode {
    OUTLINE = 0,
    FILL = 1,
    HEATMAP = 2,
    REPORT = 3
};

enum class FillPolicy {
    SOLID = 0,     // every blob in fill_color
    PALETTE = 1    // palette_color(id)
};

// Canvas the blobs are painted onto.
enum class Background {
    ORIGINAL = 0,
    BLACK = 1,
    CLEAR = 2        // fully transparent
};

struct RenderParams {
    cv::Vec3b  outline_color = cv::Vec3b(255, 0, 0);
    cv::Vec3b  fill_color = cv::Vec3b(0, 255, 0);
    FillPolicy fill = FillPolicy::PALETTE;
    Background background = Background::ORIGINAL;
};

struct RenderOutput {
    cv::Mat     image;    // RGBA, set for OUTLINE/FILL/HEATMAP
    std::string report;   // JSON, set for REPORT
};

SegError parse_render_mode(const std::string& text, RenderMode& mode);
const char* render_mode_name(RenderMode mode);
// "original", "black" or "transparent".
SegError parse_background(const std::string& text, Background& bg);

// Deterministic color for blob `id` (ids start at 1).
cv::Vec3b palette_color(int id);
// Blue -> red over [0, 0.8), red -> white over [0.8, 1].
cv::Vec3b heatmap_color(double t);

// labels is the LabelGrid the blobs came from; it is only read by FILL and
// HEATMAP. Blobs are painted in ascending id order.
SegError render(const cv::Mat& grid, const cv::Mat& labels, const std::vector<Blob>& blobs,
                RenderMode mode, const RenderParams& params, RenderOutput& out);
