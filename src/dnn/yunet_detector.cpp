#include "yunet_detector.hpp"

#include <iostream>
#include <stdexcept>

#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>

YuNetFaceDetector::YuNetFaceDetector(const std::string& model_path,
                                     float score_threshold,
                                     float nms_threshold,
                                     int top_k) {
    try {
        yunet_ = cv::FaceDetectorYN::create(model_path, "", cv::Size(320, 320),
                                            score_threshold, nms_threshold, top_k,
                                            cv::dnn::DNN_BACKEND_OPENCV, cv::dnn::DNN_TARGET_CPU);
    } catch (const cv::Exception& e) {
        throw std::runtime_error("Failed to load face detector " + model_path + ": " + e.what());
    }
    if (!yunet_) {
        throw std::runtime_error("Failed to load face detector " + model_path);
    }
    std::cout << "[detector] YuNet loaded from " << model_path
              << " (score " << score_threshold << ", nms " << nms_threshold << ")" << std::endl;
}

std::vector<FaceRegion> YuNetFaceDetector::detect(const cv::Mat& image) {
    std::vector<FaceRegion> regions;
    if (image.empty()) {
        return regions;
    }

    cv::Mat bgr;
    if (image.channels() == 4) {
        cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
    } else if (image.channels() == 1) {
        cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
    } else {
        bgr = image;
    }

    cv::Mat dets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (bgr.size() != input_size_) {
            yunet_->setInputSize(bgr.size());
            input_size_ = bgr.size();
        }
        yunet_->detect(bgr, dets);
    }

    // Row layout: x, y, w, h, 5 landmark pairs, score (column 14).
    if (dets.empty() || dets.cols < 15) {
        return regions;
    }
    for (int i = 0; i < dets.rows; ++i) {
        BoundingBox box{static_cast<int>(dets.at<float>(i, 0)),
                        static_cast<int>(dets.at<float>(i, 1)),
                        static_cast<int>(dets.at<float>(i, 2)),
                        static_cast<int>(dets.at<float>(i, 3))};
        box = clampBox(box, bgr.cols, bgr.rows);
        if (box.width == 0 || box.height == 0) {
            continue;
        }
        regions.push_back({box, dets.at<float>(i, 14)});
    }
    return regions;
}
