#pragma once
#include <opencv2/core.hpp>
#include <cstdint>

// Inclusive pixel bounds of a blob.
struct BlobBox {
    int min_x = 0, min_y = 0;
    int max_x = 0, max_y = 0;
};

struct Blob {
    int         id = 0;      // matches its LabelGrid value
    int         area = 0;    // pixel count
    BlobBox     box;
    cv::Point2d centroid;
    cv::Vec3b   color;       // mean R,G,B of members, alpha is always 255
};

// Every non-NONE value is an invalid-parameter failure, detected before any
// pixel work.
enum class SegError {
    NONE = 0,
    BAD_GRID = 1,
    BAD_PERCENTILE = 2,
    BAD_DISTANCE = 3,
    BAD_CONNECTIVITY = 4,
    BAD_MIN_AREA = 5,
    BAD_RENDER_MODE = 6,
    SIZE_MISMATCH = 7,
    BAD_COLOR = 8,
    BAD_REPORT = 9,
    BAD_BACKGROUND = 10
};

inline const char* se_to_cstr(SegError se) {
    switch (se) {
    case SegError::NONE:             return "OK";
    case SegError::BAD_GRID:         return "INVALID_GRID";
    case SegError::BAD_PERCENTILE:   return "INVALID_PERCENTILE";
    case SegError::BAD_DISTANCE:     return "INVALID_DISTANCE";
    case SegError::BAD_CONNECTIVITY: return "INVALID_CONNECTIVITY";
    case SegError::BAD_MIN_AREA:     return "INVALID_MIN_AREA";
    case SegError::BAD_RENDER_MODE:  return "INVALID_RENDER_MODE";
    case SegError::SIZE_MISMATCH:    return "SIZE_MISMATCH";
    case SegError::BAD_COLOR:        return "INVALID_COLOR";
    case SegError::BAD_REPORT:       return "INVALID_REPORT";
    case SegError::BAD_BACKGROUND:   return "INVALID_BACKGROUND";
    default:                         return "UNKNOWN";
    }
}
