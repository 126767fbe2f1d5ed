#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

enum class SubmissionError {
    None,
    InvalidImage,
    RegistryUnavailable,
    StorageFailure
};

struct RecognizedStudent {
    std::string identity_id;
    int face_index = 0;
    float similarity_score = 0.0f;
    bool on_roster = true;
};

struct AttendanceOutcome {
    AttendanceRecord record;
    WriteAction action = WriteAction::Unchanged;
};

// Response to one attendance submission. On failure the counts and lists
// are empty and nothing was written.
struct SubmissionResult {
    bool success = false;
    SubmissionError error = SubmissionError::None;
    bool retryable = false;
    std::string class_id;
    std::string date;

    int faces_detected = 0;
    int faces_recognized = 0;
    int faces_unrecognized = 0;
    std::vector<RecognizedStudent> recognized_students;  // by face_index
    std::vector<int> unrecognized_faces;                 // face indexes
    std::vector<FaceResolution> faces;                   // per-face detail
    std::vector<AttendanceOutcome> attendance;           // one per roster identity

    std::string message;
    double processing_time = 0.0;  // seconds
};

struct EnrollmentResult {
    bool success = false;
    std::string identity_id;
    bool replaced = false;
    std::string error;   // empty, or invalid_image / no_face / multiple_faces /
                         // poor_quality / embedding_failed / registry_unavailable /
                         // invalid_request / internal_error
    std::string message;
};

const char* toString(SubmissionError error);

void to_json(nlohmann::json& j, const BoundingBox& box);
void to_json(nlohmann::json& j, const FaceResolution& face);
void to_json(nlohmann::json& j, const AttendanceRecord& record);
void to_json(nlohmann::json& j, const SubmissionResult& result);
void to_json(nlohmann::json& j, const EnrollmentResult& result);
