#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "../attendance/assignment_resolver.hpp"
#include "../attendance/attendance_store.hpp"
#include "../attendance/decision_builder.hpp"
#include "../attendance/similarity_matcher.hpp"
#include "../attendance/submission_result.hpp"
#include "../dnn/face_detector.hpp"
#include "../dnn/face_embedder.hpp"
#include "../registry/signature_registry.hpp"
#include "../utils/face_quality.hpp"
#include "../utils/worker_pool.hpp"

class Config;

struct EngineSettings {
    MatchSettings match;
    size_t worker_threads = 0;   // 0 = hardware concurrency
    bool quality_check = true;
};

EngineSettings engineSettingsFromConfig(const Config& config);

// Face-match attendance pipeline: detect, embed, match, resolve, decide and
// commit. One call handles one photo and keeps no state between calls, so
// submissions may run concurrently.
class AttendanceEngine {
    public:
        AttendanceEngine(std::shared_ptr<FaceDetector> detector,
                         std::shared_ptr<FaceEmbedder> embedder,
                         std::shared_ptr<SignatureRegistry> registry,
                         std::shared_ptr<AttendanceStore> store,
                         const EngineSettings& settings,
                         std::unique_ptr<FaceQuality> quality_checker = nullptr);

        // Encoded image (JPEG, PNG, ...) for session.class_id on session.date.
        SubmissionResult submit(const std::vector<uint8_t>& image_data, const SessionContext& session);
        SubmissionResult submitImage(const cv::Mat& image, const SessionContext& session);

        EnrollmentResult enroll(const std::string& identity_id, const std::vector<uint8_t>& image_data);
        EnrollmentResult enrollImage(const std::string& identity_id, const cv::Mat& image);

        // Throws RegistryUnavailableError.
        bool removeEnrollment(const std::string& identity_id);

        // Throws StorageError.
        std::vector<AttendanceRecord> sessionRecords(const std::string& class_id, const std::string& date);

        const EngineSettings& settings() const { return settings_; }

    private:
        std::vector<DetectedFace> detectAndEmbed(const cv::Mat& image);
        SubmissionResult runPipeline(const cv::Mat& image, const SessionContext& session);

        std::shared_ptr<FaceDetector> detector_;
        std::shared_ptr<FaceEmbedder> embedder_;
        std::shared_ptr<SignatureRegistry> registry_;
        std::shared_ptr<AttendanceStore> store_;
        EngineSettings settings_;
        std::unique_ptr<FaceQuality> quality_checker_;
        WorkerPool pool_;
        SimilarityMatcher matcher_;
        AssignmentResolver resolver_;
        DecisionBuilder decision_builder_;
};

// Throws InvalidImageError when the bytes are not a decodable image.
cv::Mat decodeImage(const std::vector<uint8_t>& image_data);
