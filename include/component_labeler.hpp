#pragma once
#include "types.hpp"
#include <opencv2/core.hpp>
#include <vector>

struct LabelingParams {
    int  connectivity = 4;   // 4 or 8
    int  min_area = 1;       // blobs smaller than this are dropped
    bool debug = false;
};

struct Labeling {
    cv::Mat           labels;   // CV_32SC1, 0 = background, blob ids from 1
    std::vector<Blob> blobs;    // ordered by id
};

// Two-pass union-find connected components over a CV_8UC1 mask (non-zero is
// foreground). Blob ids follow first discovery in raster order. grid, if not
// empty, is the RGBA source the blob colors are averaged from.
SegError label_components(const cv::Mat& mask, const cv::Mat& grid,
                          const LabelingParams& params, Labeling& out);
