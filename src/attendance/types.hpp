#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

// L2-normalised face signature. Dimension is fixed per registry.
using Signature = std::vector<float>;

struct BoundingBox {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

// One face found in a submitted photo. face_index is the position after
// sorting left-to-right, then top-to-bottom.
struct DetectedFace {
    int face_index = 0;
    BoundingBox box;
    float detector_score = 0.0f;
    Signature signature;   // empty when embedding failed
};

struct RegistryMatch {
    std::string identity_id;
    float similarity_score = 0.0f;
};

struct MatchCandidate {
    int face_index = 0;
    std::string identity_id;
    float similarity_score = 0.0f;
};

struct ResolvedMatch {
    int face_index = 0;
    std::string identity_id;
    float similarity_score = 0.0f;
};

enum class UnrecognizedReason {
    NoCandidate,              // registry returned nothing
    BelowThreshold,           // every candidate scored under the threshold
    ClaimedByStrongerMatch,   // every candidate identity went to another face
    ProcessingFailed          // crop or embedding failed for this face
};

struct Recognized {
    std::string identity_id;
    float similarity_score = 0.0f;
};

struct Unrecognized {
    UnrecognizedReason reason = UnrecognizedReason::NoCandidate;
};

using FaceOutcome = std::variant<Recognized, Unrecognized>;

struct FaceResolution {
    int face_index = 0;
    BoundingBox box;
    FaceOutcome outcome;
};

enum class AttendanceStatus { Present, Absent, Late };
enum class AttendanceMethod { Manual, FaceMatch };

struct AttendanceRecord {
    std::string class_id;
    std::string identity_id;
    std::string date;                       // YYYY-MM-DD
    AttendanceStatus status = AttendanceStatus::Absent;
    AttendanceMethod method = AttendanceMethod::Manual;
    std::optional<float> confidence_score;  // set only for FaceMatch
    std::string marked_by;
    std::string created_at;                 // filled by the store
};

enum class WriteAction { Inserted, Updated, Unchanged };

struct SessionContext {
    std::string class_id;
    std::string date;
    float threshold = 0.6f;
    std::string marked_by;
};

const char* toString(AttendanceStatus status);
const char* toString(AttendanceMethod method);
const char* toString(WriteAction action);
const char* toString(UnrecognizedReason reason);

std::optional<AttendanceStatus> parseStatus(const std::string& value);
std::optional<AttendanceMethod> parseMethod(const std::string& value);
