#pragma once

#include <algorithm>
#include <string>
#include <variant>
#include <vector>

#include <opencv2/imgproc.hpp>

#include "../attendance/types.hpp"

// Draws every face of a submission for operator review: recognized faces in
// green with identity and score, unrecognized ones in red with the reason.
static cv::Mat drawFaceResolutions(const cv::Mat &img,
                                   const std::vector<FaceResolution> &faces) {
  cv::Mat outImg;
  img.convertTo(outImg, CV_8UC3);

  for (auto &f : faces) {
    cv::Rect rect(f.box.x, f.box.y, f.box.width, f.box.height);
    cv::Scalar color;
    std::string text = "#" + std::to_string(f.face_index) + " ";

    if (const auto *r = std::get_if<Recognized>(&f.outcome)) {
      color = cv::Scalar(0, 200, 0);
      text += r->identity_id + " " + std::to_string(r->similarity_score).substr(0, 4);
    } else {
      color = cv::Scalar(0, 0, 255);
      text += toString(std::get<Unrecognized>(f.outcome).reason);
    }

    cv::rectangle(outImg, rect, color, 2);
    int baseline = 0;
    cv::Size textSize = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, 0.5, 1, &baseline);
    cv::Point textPos(rect.x, std::max(textSize.height + 2, rect.y - 4));
    cv::putText(outImg, text, textPos, cv::FONT_HERSHEY_SIMPLEX, 0.5, color, 1);
  }
  return outImg;
}
