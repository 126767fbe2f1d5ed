#ifndef FACE_QUALITY_HPP
#define FACE_QUALITY_HPP

#include <string>
#include <vector>

#include <opencv2/core.hpp>

struct QualityResult {
    bool is_good_quality = false;
    float quality_score = 0.0f;   // fraction of checks passed
    float blur_score = 0.0f;      // Laplacian variance
    bool blur_pass = false;
    bool size_pass = false;
    bool lighting_pass = false;

    // Names of the failed checks, e.g. {"blur", "size"}.
    std::vector<std::string> failedChecks() const;
};

// Enrollment gate on blur, face size and lighting.
class FaceQuality {
public:
    FaceQuality(float blur_threshold = 100.0f,
                float min_face_size = 60.0f,
                float dark_ratio_threshold = 0.4f,
                float bright_ratio_threshold = 0.3f,
                float quality_threshold = 0.5f);

    QualityResult validate(const cv::Mat& face_roi) const;

private:
    float blur_threshold_;
    float min_face_size_;
    float dark_ratio_threshold_;
    float bright_ratio_threshold_;
    float quality_threshold_;

    float blurScore(const cv::Mat& gray) const;
    bool checkSize(const cv::Mat& face) const;
    bool checkLighting(const cv::Mat& gray) const;
};

#endif // FACE_QUALITY_HPP
