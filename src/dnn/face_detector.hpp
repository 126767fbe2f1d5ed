#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "../attendance/types.hpp"

struct FaceRegion {
    BoundingBox box;
    float score = 0.0f;
};

class FaceDetector {
public:
    virtual ~FaceDetector() = default;

    // Zero or more faces, in any order. Boxes are clamped to the image.
    virtual std::vector<FaceRegion> detect(const cv::Mat& image) = 0;
};

// Sorts regions left-to-right, then top-to-bottom, and numbers them from 0.
// This is the face_index order used for a whole submission.
std::vector<DetectedFace> indexFaces(std::vector<FaceRegion> regions);

// Clamps a box to the image and drops empty intersections (width/height 0).
BoundingBox clampBox(const BoundingBox& box, int cols, int rows);
