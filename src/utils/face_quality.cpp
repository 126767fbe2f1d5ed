#include "face_quality.hpp"

#include <opencv2/imgproc.hpp>

std::vector<std::string> QualityResult::failedChecks() const {
    std::vector<std::string> failed;
    if (!blur_pass) failed.push_back("blur");
    if (!size_pass) failed.push_back("size");
    if (!lighting_pass) failed.push_back("lighting");
    return failed;
}

FaceQuality::FaceQuality(float blur_threshold,
                         float min_face_size,
                         float dark_ratio_threshold,
                         float bright_ratio_threshold,
                         float quality_threshold)
    : blur_threshold_(blur_threshold),
      min_face_size_(min_face_size),
      dark_ratio_threshold_(dark_ratio_threshold),
      bright_ratio_threshold_(bright_ratio_threshold),
      quality_threshold_(quality_threshold) {
}

float FaceQuality::blurScore(const cv::Mat& gray) const {
    cv::Mat laplacian;
    cv::Laplacian(gray, laplacian, CV_64F);

    cv::Scalar mean, stddev;
    cv::meanStdDev(laplacian, mean, stddev);
    return static_cast<float>(stddev.val[0] * stddev.val[0]);
}

bool FaceQuality::checkSize(const cv::Mat& face) const {
    return face.rows >= min_face_size_ && face.cols >= min_face_size_;
}

bool FaceQuality::checkLighting(const cv::Mat& gray) const {
    // Share of very dark (< 50) and very bright (>= 200) pixels.
    const double total = static_cast<double>(gray.total());
    if (total == 0.0) {
        return false;
    }
    const double dark = cv::countNonZero(gray < 50) / total;
    const double bright = cv::countNonZero(gray >= 200) / total;
    return dark < dark_ratio_threshold_ && bright < bright_ratio_threshold_;
}

QualityResult FaceQuality::validate(const cv::Mat& face_roi) const {
    QualityResult result;
    if (face_roi.empty()) {
        return result;
    }

    cv::Mat gray;
    if (face_roi.channels() == 3) {
        cv::cvtColor(face_roi, gray, cv::COLOR_BGR2GRAY);
    } else if (face_roi.channels() == 4) {
        cv::cvtColor(face_roi, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = face_roi;
    }

    result.blur_score = blurScore(gray);
    result.blur_pass = result.blur_score > blur_threshold_;
    result.size_pass = checkSize(gray);
    result.lighting_pass = checkLighting(gray);

    int passed = static_cast<int>(result.blur_pass) +
                 static_cast<int>(result.size_pass) +
                 static_cast<int>(result.lighting_pass);
    result.quality_score = passed / 3.0f;
    // Undersized crops are never usable regardless of the score.
    result.is_good_quality = result.size_pass && result.quality_score >= quality_threshold_;
    return result;
}
