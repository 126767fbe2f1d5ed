#pragma once

#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

#include "face_embedder.hpp"

class SubNet;

// FaceNet-style embedding over ONNX Runtime. Crops are resized to
// input_size x input_size RGB, standardised as (p - 127.5) / 128, fed as
// NCHW and the output is L2-normalised.
class OnnxFaceEmbedder : public FaceEmbedder {
public:
    OnnxFaceEmbedder(const std::string& model_path, size_t dimension,
                     int input_size = 160, int margin = 0);
    ~OnnxFaceEmbedder() override;

    Signature embed(const cv::Mat& image, const BoundingBox& box) override;
    size_t dimension() const override { return dimension_; }

private:
    std::vector<float> toTensor(const cv::Mat& face) const;

    Ort::Env env_;
    Ort::SessionOptions session_options_;
    Ort::MemoryInfo memory_info_;
    std::unique_ptr<SubNet> net_;
    size_t dimension_;
    int input_size_;
    int margin_;
};
