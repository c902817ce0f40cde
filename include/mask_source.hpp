#pragma once
#include "types.hpp"
#include "dynamic_threshold.hpp"
#include "color_mask.hpp"
#include <opencv2/core.hpp>
#include <memory>

// Anything that turns a grid into a same-sized CV_8UC1 foreground mask.
// The labeler does not care which criterion produced the mask.
class MaskSource {
public:
    virtual ~MaskSource() = default;
    virtual SegError build(const cv::Mat& grid, cv::Mat& mask) const = 0;
    virtual const char* name() const = 0;
};

class ThresholdMaskSource : public MaskSource {
public:
    explicit ThresholdMaskSource(const ThresholdParams& params) : m_params(params) {}
    SegError build(const cv::Mat& grid, cv::Mat& mask) const override;
    const char* name() const override { return "threshold"; }

private:
    ThresholdParams m_params;
};

class ColorMaskSource : public MaskSource {
public:
    explicit ColorMaskSource(const ColorMaskParams& params) : m_params(params) {}
    SegError build(const cv::Mat& grid, cv::Mat& mask) const override;
    const char* name() const override { return "color"; }

private:
    ColorMaskParams m_params;
};
