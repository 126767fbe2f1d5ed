#include "attendance_engine.hpp"
#include "../attendance/errors.hpp"
#include "../utils/config.hpp"

#include <chrono>
#include <future>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include <opencv2/imgcodecs.hpp>

EngineSettings engineSettingsFromConfig(const Config& config) {
    EngineSettings settings;
    settings.match.threshold = config.match_threshold;
    settings.match.top_k = config.top_k;
    settings.match.timeout = std::chrono::milliseconds(config.registry_timeout_ms);
    settings.match.retries = config.registry_retries;
    settings.match.backoff = std::chrono::milliseconds(config.registry_backoff_ms);
    settings.worker_threads = static_cast<size_t>(config.worker_threads);
    settings.quality_check = config.quality_check;
    return settings;
}

cv::Mat decodeImage(const std::vector<uint8_t>& image_data) {
    if (image_data.empty()) {
        throw InvalidImageError("Image payload is empty");
    }
    cv::Mat image;
    try {
        image = cv::imdecode(image_data, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw InvalidImageError(std::string("Image could not be decoded: ") + e.what());
    }
    if (image.empty()) {
        throw InvalidImageError("Image could not be decoded");
    }
    return image;
}

AttendanceEngine::AttendanceEngine(std::shared_ptr<FaceDetector> detector,
                                   std::shared_ptr<FaceEmbedder> embedder,
                                   std::shared_ptr<SignatureRegistry> registry,
                                   std::shared_ptr<AttendanceStore> store,
                                   const EngineSettings& settings,
                                   std::unique_ptr<FaceQuality> quality_checker)
    : detector_(std::move(detector)),
      embedder_(std::move(embedder)),
      registry_(std::move(registry)),
      store_(std::move(store)),
      settings_(settings),
      quality_checker_(std::move(quality_checker)),
      pool_(settings.worker_threads),
      matcher_(registry_, pool_) {
    if (!detector_ || !embedder_ || !registry_ || !store_) {
        throw std::invalid_argument("AttendanceEngine needs a detector, embedder, registry and store");
    }
    if (embedder_->dimension() != registry_->dimension()) {
        throw std::invalid_argument("Embedder dimension " + std::to_string(embedder_->dimension()) +
                                    " does not match registry dimension " +
                                    std::to_string(registry_->dimension()));
    }
    if (settings_.quality_check && !quality_checker_) {
        quality_checker_ = std::make_unique<FaceQuality>();
    }
    std::cout << "[engine] Ready with " << pool_.size() << " worker thread(s)" << std::endl;
}

std::vector<DetectedFace> AttendanceEngine::detectAndEmbed(const cv::Mat& image) {
    std::vector<DetectedFace> faces = indexFaces(detector_->detect(image));

    // Embeddings are independent per face; collect them all before matching.
    std::vector<std::future<Signature>> pending;
    pending.reserve(faces.size());
    for (const auto& face : faces) {
        auto embedder = embedder_;
        BoundingBox box = face.box;
        pending.push_back(pool_.submit([embedder, image, box] {
            return embedder->embed(image, box);
        }));
    }

    for (size_t i = 0; i < faces.size(); ++i) {
        try {
            Signature signature = pending[i].get();
            if (signature.size() != registry_->dimension()) {
                std::cerr << "[engine] Face " << faces[i].face_index << ": signature has "
                          << signature.size() << " values, expected " << registry_->dimension() << std::endl;
                continue;
            }
            faces[i].signature = std::move(signature);
        } catch (const std::exception& e) {
            std::cerr << "[engine] Face " << faces[i].face_index << " embedding failed: " << e.what() << std::endl;
        }
    }
    return faces;
}

SubmissionResult AttendanceEngine::submit(const std::vector<uint8_t>& image_data, const SessionContext& session) {
    cv::Mat image;
    try {
        image = decodeImage(image_data);
    } catch (const InvalidImageError& e) {
        std::cerr << "[engine] Rejected submission for class " << session.class_id << ": " << e.what() << std::endl;
        SubmissionResult result;
        result.class_id = session.class_id;
        result.date = session.date;
        result.error = SubmissionError::InvalidImage;
        result.message = e.what();
        return result;
    }
    return submitImage(image, session);
}

SubmissionResult AttendanceEngine::submitImage(const cv::Mat& image, const SessionContext& session) {
    auto start_time = std::chrono::steady_clock::now();
    SubmissionResult result = runPipeline(image, session);
    auto end_time = std::chrono::steady_clock::now();
    result.processing_time =
        std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count() / 1000.0;

    std::cout << "[engine] class=" << session.class_id << " date=" << session.date
              << " success=" << (result.success ? "true" : "false")
              << " detected=" << result.faces_detected
              << " recognized=" << result.faces_recognized
              << " unrecognized=" << result.faces_unrecognized
              << " elapsed=" << static_cast<int>(result.processing_time * 1000) << "ms" << std::endl;
    return result;
}

SubmissionResult AttendanceEngine::runPipeline(const cv::Mat& image, const SessionContext& session) {
    SubmissionResult result;
    result.class_id = session.class_id;
    result.date = session.date;

    if (!isUnitInterval(session.threshold)) {
        throw std::invalid_argument("Session threshold must be within [0, 1]");
    }

    if (image.empty()) {
        result.error = SubmissionError::InvalidImage;
        result.message = "Image is empty";
        return result;
    }

    std::vector<DetectedFace> faces;
    try {
        faces = detectAndEmbed(image);
    } catch (const std::exception& e) {
        std::cerr << "[engine] Face detection error: " << e.what() << std::endl;
        result.error = SubmissionError::InvalidImage;
        result.message = std::string("Face detection failed: ") + e.what();
        return result;
    }

    result.faces_detected = static_cast<int>(faces.size());
    if (faces.empty()) {
        result.success = true;
        result.message = "No faces detected in the image";
        return result;
    }

    MatchSettings match = settings_.match;
    match.threshold = session.threshold;

    std::vector<FaceCandidates> per_face;
    try {
        per_face = matcher_.match(faces, match);
    } catch (const RegistryUnavailableError& e) {
        result = SubmissionResult{};
        result.class_id = session.class_id;
        result.date = session.date;
        result.error = SubmissionError::RegistryUnavailable;
        result.retryable = true;
        result.message = std::string("Face registry unavailable, please retry: ") + e.what();
        return result;
    }

    std::vector<MatchCandidate> candidates;
    for (const auto& fc : per_face) {
        candidates.insert(candidates.end(), fc.candidates.begin(), fc.candidates.end());
    }
    std::vector<ResolvedMatch> resolved = resolver_.resolve(std::move(candidates));

    std::vector<AttendanceDecision> decisions;
    std::vector<StoredRecord> stored;
    std::unordered_set<std::string> roster_set;
    try {
        std::vector<std::string> roster = store_->loadRoster(session.class_id);
        roster_set.insert(roster.begin(), roster.end());
        decisions = decision_builder_.build(session, resolved, roster,
                                            store_->loadSession(session.class_id, session.date));

        std::vector<AttendanceRecord> records;
        records.reserve(decisions.size());
        for (const auto& d : decisions) {
            records.push_back(d.record);
        }
        if (!records.empty()) {
            stored = store_->commit(records);
        }
    } catch (const StorageError& e) {
        std::cerr << "[engine] Attendance store error: " << e.what() << std::endl;
        result = SubmissionResult{};
        result.class_id = session.class_id;
        result.date = session.date;
        result.error = SubmissionError::StorageFailure;
        result.retryable = true;
        result.message = std::string("Attendance could not be saved, please retry: ") + e.what();
        return result;
    }

    result.success = true;
    result.faces = resolver_.describe(faces, per_face, resolved);
    result.faces_recognized = static_cast<int>(resolved.size());
    result.faces_unrecognized = result.faces_detected - result.faces_recognized;

    int off_roster = 0;
    for (const auto& r : resolved) {
        bool on_roster = roster_set.count(r.identity_id) > 0;
        if (!on_roster) {
            ++off_roster;
        }
        result.recognized_students.push_back({r.identity_id, r.face_index, r.similarity_score, on_roster});
    }
    for (const auto& f : result.faces) {
        if (std::holds_alternative<Unrecognized>(f.outcome)) {
            result.unrecognized_faces.push_back(f.face_index);
        }
    }

    int newly_present = 0;
    for (const auto& s : stored) {
        if (s.action != WriteAction::Unchanged && s.record.status == AttendanceStatus::Present) {
            ++newly_present;
        }
        result.attendance.push_back({s.record, s.action});
    }

    std::ostringstream msg;
    msg << "Recognized " << result.faces_recognized << " of " << result.faces_detected << " face(s)";
    msg << "; " << newly_present << " newly marked present";
    if (off_roster > 0) {
        msg << "; " << off_roster << " recognized identity(ies) not enrolled in this class";
    }
    result.message = msg.str();
    return result;
}

EnrollmentResult AttendanceEngine::enroll(const std::string& identity_id, const std::vector<uint8_t>& image_data) {
    cv::Mat image;
    try {
        image = decodeImage(image_data);
    } catch (const InvalidImageError& e) {
        EnrollmentResult result;
        result.identity_id = identity_id;
        result.error = "invalid_image";
        result.message = e.what();
        return result;
    }
    return enrollImage(identity_id, image);
}

EnrollmentResult AttendanceEngine::enrollImage(const std::string& identity_id, const cv::Mat& image) {
    EnrollmentResult result;
    result.identity_id = identity_id;

    try {
        if (identity_id.empty()) {
            throw std::invalid_argument("identity_id must not be empty");
        }
        if (image.empty()) {
            throw InvalidImageError("Image is empty");
        }

        std::vector<FaceRegion> regions;
        try {
            regions = detector_->detect(image);
        } catch (const std::exception& e) {
            throw InvalidImageError(std::string("Face detection failed: ") + e.what());
        }
        if (regions.empty()) {
            throw EnrollmentError(EnrollmentFailure::NoFace, "No face detected in the image");
        }
        if (regions.size() > 1) {
            throw EnrollmentError(EnrollmentFailure::MultipleFaces,
                                  "Multiple faces found in the image (" + std::to_string(regions.size()) + ")");
        }
        const BoundingBox& box = regions[0].box;

        if (settings_.quality_check) {
            BoundingBox crop = clampBox(box, image.cols, image.rows);
            cv::Mat roi = image(cv::Rect(crop.x, crop.y, crop.width, crop.height));
            QualityResult quality;
            try {
                quality = quality_checker_->validate(roi);
            } catch (const cv::Exception& e) {
                throw InvalidImageError(std::string("Quality check failed: ") + e.what());
            }
            if (!quality.is_good_quality) {
                std::string failed;
                for (const auto& check : quality.failedChecks()) {
                    failed += (failed.empty() ? "" : ", ") + check;
                }
                throw EnrollmentError(EnrollmentFailure::PoorQuality, "Poor quality face (failed: " + failed + ")");
            }
        }

        Signature signature;
        try {
            signature = embedder_->embed(image, box);
        } catch (const std::exception& e) {
            throw EnrollmentError(EnrollmentFailure::EmbeddingFailed, std::string("Embedding failed: ") + e.what());
        }
        if (signature.size() != registry_->dimension()) {
            throw EnrollmentError(EnrollmentFailure::EmbeddingFailed, "Signature dimension mismatch");
        }

        result.replaced = registry_->upsert(identity_id, signature);
        result.success = true;
        result.message = result.replaced ? "Face signature replaced" : "Face signature stored";
        std::cout << "[engine] Enrolled " << identity_id << (result.replaced ? " (replaced)" : "") << std::endl;
    } catch (const EnrollmentError& e) {
        switch (e.failure()) {
            case EnrollmentFailure::NoFace: result.error = "no_face"; break;
            case EnrollmentFailure::MultipleFaces: result.error = "multiple_faces"; break;
            case EnrollmentFailure::PoorQuality: result.error = "poor_quality"; break;
            case EnrollmentFailure::EmbeddingFailed: result.error = "embedding_failed"; break;
        }
        result.message = e.what();
    } catch (const InvalidImageError& e) {
        result.error = "invalid_image";
        result.message = e.what();
    } catch (const RegistryUnavailableError& e) {
        result.error = "registry_unavailable";
        result.message = std::string("Face registry unavailable, please retry: ") + e.what();
    } catch (const std::invalid_argument& e) {
        result.error = "invalid_request";
        result.message = e.what();
    } catch (const std::exception& e) {
        result.error = "internal_error";
        result.message = std::string("Enrollment failed: ") + e.what();
    }

    if (!result.success) {
        std::cerr << "[engine] Enrollment of " << identity_id << " failed: " << result.message << std::endl;
    }
    return result;
}

bool AttendanceEngine::removeEnrollment(const std::string& identity_id) {
    bool removed = registry_->remove(identity_id);
    std::cout << "[engine] Removed enrollment " << identity_id << (removed ? "" : " (none stored)") << std::endl;
    return removed;
}

std::vector<AttendanceRecord> AttendanceEngine::sessionRecords(const std::string& class_id, const std::string& date) {
    return store_->loadSession(class_id, date);
}
