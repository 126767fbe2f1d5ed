#pragma once

#include <mutex>
#include <string>

#include <opencv2/objdetect.hpp>

#include "face_detector.hpp"

// YuNet detector through cv::FaceDetectorYN.
class YuNetFaceDetector : public FaceDetector {
public:
    YuNetFaceDetector(const std::string& model_path,
                      float score_threshold = 0.7f,
                      float nms_threshold = 0.3f,
                      int top_k = 5000);

    std::vector<FaceRegion> detect(const cv::Mat& image) override;

private:
    cv::Ptr<cv::FaceDetectorYN> yunet_;
    cv::Size input_size_{0, 0};
    std::mutex mutex_;   // FaceDetectorYN keeps per-input-size state
};
