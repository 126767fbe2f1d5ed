#include "face_detector.hpp"

#include <algorithm>

std::vector<DetectedFace> indexFaces(std::vector<FaceRegion> regions) {
    std::stable_sort(regions.begin(), regions.end(), [](const FaceRegion& a, const FaceRegion& b) {
        if (a.box.x != b.box.x) return a.box.x < b.box.x;
        return a.box.y < b.box.y;
    });

    std::vector<DetectedFace> faces;
    faces.reserve(regions.size());
    for (size_t i = 0; i < regions.size(); ++i) {
        DetectedFace face;
        face.face_index = static_cast<int>(i);
        face.box = regions[i].box;
        face.detector_score = regions[i].score;
        faces.push_back(std::move(face));
    }
    return faces;
}

BoundingBox clampBox(const BoundingBox& box, int cols, int rows) {
    int x1 = std::clamp(box.x, 0, cols);
    int y1 = std::clamp(box.y, 0, rows);
    int x2 = std::clamp(box.x + box.width, 0, cols);
    int y2 = std::clamp(box.y + box.height, 0, rows);
    return BoundingBox{x1, y1, std::max(0, x2 - x1), std::max(0, y2 - y1)};
}
