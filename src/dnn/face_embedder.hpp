#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "../attendance/types.hpp"

class FaceEmbedder {
public:
    virtual ~FaceEmbedder() = default;

    // Signature for the face inside `box`. Throws on a crop or inference
    // failure; the caller decides how to degrade.
    virtual Signature embed(const cv::Mat& image, const BoundingBox& box) = 0;

    virtual size_t dimension() const = 0;
};
