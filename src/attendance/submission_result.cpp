#include "submission_result.hpp"

#include <variant>

const char* toString(SubmissionError error) {
    switch (error) {
        case SubmissionError::None: return "";
        case SubmissionError::InvalidImage: return "invalid_image";
        case SubmissionError::RegistryUnavailable: return "registry_unavailable";
        case SubmissionError::StorageFailure: return "storage_failure";
    }
    return "";
}

void to_json(nlohmann::json& j, const BoundingBox& box) {
    j = nlohmann::json{{"x", box.x}, {"y", box.y}, {"width", box.width}, {"height", box.height}};
}

void to_json(nlohmann::json& j, const FaceResolution& face) {
    j = nlohmann::json{{"face_index", face.face_index}, {"bbox", face.box}};
    if (const auto* r = std::get_if<Recognized>(&face.outcome)) {
        j["recognized"] = true;
        j["identity_id"] = r->identity_id;
        j["similarity_score"] = r->similarity_score;
    } else {
        j["recognized"] = false;
        j["reason"] = toString(std::get<Unrecognized>(face.outcome).reason);
    }
}

void to_json(nlohmann::json& j, const AttendanceRecord& record) {
    j = nlohmann::json{
        {"class_id", record.class_id},
        {"identity_id", record.identity_id},
        {"date", record.date},
        {"status", toString(record.status)},
        {"method", toString(record.method)},
        {"confidence_score", nullptr},
        {"marked_by", record.marked_by},
        {"created_at", record.created_at}
    };
    if (record.confidence_score) {
        j["confidence_score"] = *record.confidence_score;
    }
}

void to_json(nlohmann::json& j, const SubmissionResult& result) {
    nlohmann::json recognized = nlohmann::json::array();
    for (const auto& s : result.recognized_students) {
        recognized.push_back({
            {"identity_id", s.identity_id},
            {"face_index", s.face_index},
            {"similarity_score", s.similarity_score},
            {"on_roster", s.on_roster}
        });
    }
    nlohmann::json unrecognized = nlohmann::json::array();
    for (int index : result.unrecognized_faces) {
        unrecognized.push_back({{"face_index", index}});
    }
    nlohmann::json attendance = nlohmann::json::array();
    for (const auto& a : result.attendance) {
        nlohmann::json row = a.record;
        row["action"] = toString(a.action);
        attendance.push_back(std::move(row));
    }

    j = nlohmann::json{
        {"success", result.success},
        {"class_id", result.class_id},
        {"date", result.date},
        {"faces_detected", result.faces_detected},
        {"faces_recognized", result.faces_recognized},
        {"faces_unrecognized", result.faces_unrecognized},
        {"recognized_students", recognized},
        {"unrecognized_faces", unrecognized},
        {"faces", result.faces},
        {"attendance", attendance},
        {"message", result.message},
        {"processing_time", result.processing_time}
    };
    if (!result.success) {
        j["error"] = toString(result.error);
        j["retryable"] = result.retryable;
    }
}

void to_json(nlohmann::json& j, const EnrollmentResult& result) {
    j = nlohmann::json{
        {"success", result.success},
        {"identity_id", result.identity_id},
        {"replaced", result.replaced},
        {"message", result.message}
    };
    if (!result.success) {
        j["error"] = result.error;
    }
}
