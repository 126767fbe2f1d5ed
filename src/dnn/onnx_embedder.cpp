#include "onnx_embedder.hpp"
#include "face_detector.hpp"
#include "onnx_module.h"
#include "../registry/signature_registry.hpp"

#include <iostream>
#include <stdexcept>

#include <opencv2/imgproc.hpp>

OnnxFaceEmbedder::OnnxFaceEmbedder(const std::string& model_path, size_t dimension,
                                   int input_size, int margin)
    : env_(ORT_LOGGING_LEVEL_ERROR, "face_embedding"),
      memory_info_(Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator, OrtMemType::OrtMemTypeDefault)),
      dimension_(dimension),
      input_size_(input_size),
      margin_(margin) {
    net_ = std::make_unique<SubNet>(env_, session_options_, model_path);
    std::cout << "[embedder] Loaded " << model_path << " (" << input_size_ << "x" << input_size_
              << " -> " << dimension_ << ")" << std::endl;
}

OnnxFaceEmbedder::~OnnxFaceEmbedder() = default;

std::vector<float> OnnxFaceEmbedder::toTensor(const cv::Mat& face) const {
    cv::Mat rgb;
    if (face.channels() == 3) {
        cv::cvtColor(face, rgb, cv::COLOR_BGR2RGB);
    } else if (face.channels() == 4) {
        cv::cvtColor(face, rgb, cv::COLOR_BGRA2RGB);
    } else {
        cv::cvtColor(face, rgb, cv::COLOR_GRAY2RGB);
    }

    cv::Mat resized;
    cv::resize(rgb, resized, cv::Size(input_size_, input_size_), 0, 0, cv::INTER_LINEAR);

    cv::Mat standardized;
    resized.convertTo(standardized, CV_32FC3, 1.0 / 128.0, -127.5 / 128.0);

    // HWC -> CHW
    std::vector<cv::Mat> channels(3);
    cv::split(standardized, channels);
    const size_t plane = static_cast<size_t>(input_size_) * input_size_;
    std::vector<float> tensor(3 * plane);
    for (int c = 0; c < 3; ++c) {
        cv::Mat dst(input_size_, input_size_, CV_32F, tensor.data() + c * plane);
        channels[c].copyTo(dst);
    }
    return tensor;
}

Signature OnnxFaceEmbedder::embed(const cv::Mat& image, const BoundingBox& box) {
    BoundingBox padded{box.x - margin_, box.y - margin_,
                       box.width + 2 * margin_, box.height + 2 * margin_};
    BoundingBox crop = clampBox(padded, image.cols, image.rows);
    if (crop.width < 2 || crop.height < 2) {
        throw std::runtime_error("Face crop is empty");
    }

    cv::Mat face = image(cv::Rect(crop.x, crop.y, crop.width, crop.height));
    std::vector<float> tensor = toTensor(face);

    std::vector<int64_t> input_shape = {1, 3, input_size_, input_size_};
    Ort::Value face_tensor = Ort::Value::CreateTensor<float>(
        memory_info_,
        tensor.data(),
        tensor.size(),
        input_shape.data(),
        input_shape.size()
    );

    std::vector<Ort::Value> outputs = net_->forward(face_tensor);
    size_t length = outputs[0].GetTensorTypeAndShapeInfo().GetElementCount();
    if (length != dimension_) {
        throw std::runtime_error("Embedding model produced " + std::to_string(length) +
                                 " values, expected " + std::to_string(dimension_));
    }

    const float* embedding = outputs[0].GetTensorData<float>();
    Signature signature(embedding, embedding + length);
    l2Normalize(signature);
    return signature;
}
