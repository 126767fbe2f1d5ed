#pragma once

#include <atomic>
#include <chrono>
#include <cmath>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <opencv2/imgcodecs.hpp>

#include "../attendance/errors.hpp"
#include "../dnn/face_detector.hpp"
#include "../dnn/face_embedder.hpp"
#include "../registry/memory_registry.hpp"

constexpr size_t kTestDim = 8;

// Unit vector along `axis`.
inline Signature axisSignature(size_t axis, size_t dim = kTestDim) {
    Signature s(dim, 0.0f);
    s[axis] = 1.0f;
    return s;
}

// Unit vector whose cosine with axisSignature(axis) is `score`; the rest of
// its length lies on `spare`, which no enrolled identity uses.
inline Signature towards(size_t axis, float score, size_t spare, size_t dim = kTestDim) {
    Signature s(dim, 0.0f);
    s[axis] = score;
    s[spare] = std::sqrt(1.0f - score * score);
    return s;
}

inline FaceRegion regionAt(int x, int y = 8, int size = 20) {
    return FaceRegion{BoundingBox{x, y, size, size}, 0.9f};
}

inline std::vector<uint8_t> encodedImage(int cols = 128, int rows = 64) {
    cv::Mat img(rows, cols, CV_8UC3, cv::Scalar(120, 120, 120));
    std::vector<uint8_t> buf;
    cv::imencode(".png", img, buf);
    return buf;
}

// Returns the same regions for every image.
class ScriptedDetector : public FaceDetector {
public:
    explicit ScriptedDetector(std::vector<FaceRegion> regions = {}) : regions_(std::move(regions)) {}

    std::vector<FaceRegion> detect(const cv::Mat&) override {
        if (fail_) {
            throw std::runtime_error("detector exploded");
        }
        return regions_;
    }

    void setRegions(std::vector<FaceRegion> regions) { regions_ = std::move(regions); }
    void setFail(bool fail) { fail_ = fail; }

private:
    std::vector<FaceRegion> regions_;
    bool fail_ = false;
};

// Signature chosen by the box's x coordinate; unknown boxes fail to embed.
class ScriptedEmbedder : public FaceEmbedder {
public:
    explicit ScriptedEmbedder(size_t dim = kTestDim) : dim_(dim) {}

    void set(int x, Signature signature) { by_x_[x] = std::move(signature); }

    Signature embed(const cv::Mat&, const BoundingBox& box) override {
        auto it = by_x_.find(box.x);
        if (it == by_x_.end()) {
            throw std::runtime_error("no signature scripted for x=" + std::to_string(box.x));
        }
        return it->second;
    }

    size_t dimension() const override { return dim_; }

private:
    size_t dim_;
    std::map<int, Signature> by_x_;
};

// Memory registry whose queries sleep, or fail a set number of times first.
class ControlledRegistry : public MemorySignatureRegistry {
public:
    explicit ControlledRegistry(size_t dim = kTestDim) : MemorySignatureRegistry(dim) {}

    std::vector<RegistryMatch> query(const Signature& signature, int top_k) override {
        ++queries;
        if (failures_left.load() > 0) {
            --failures_left;
            throw RegistryUnavailableError("registry connection refused");
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        return MemorySignatureRegistry::query(signature, top_k);
    }

    std::atomic<int> failures_left{0};
    std::atomic<int> queries{0};
    std::chrono::milliseconds delay{0};
};
