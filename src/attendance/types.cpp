#include "types.hpp"

const char* toString(AttendanceStatus status) {
    switch (status) {
        case AttendanceStatus::Present: return "present";
        case AttendanceStatus::Absent: return "absent";
        case AttendanceStatus::Late: return "late";
    }
    return "absent";
}

const char* toString(AttendanceMethod method) {
    switch (method) {
        case AttendanceMethod::Manual: return "manual";
        case AttendanceMethod::FaceMatch: return "face_match";
    }
    return "manual";
}

const char* toString(WriteAction action) {
    switch (action) {
        case WriteAction::Inserted: return "inserted";
        case WriteAction::Updated: return "updated";
        case WriteAction::Unchanged: return "unchanged";
    }
    return "unchanged";
}

const char* toString(UnrecognizedReason reason) {
    switch (reason) {
        case UnrecognizedReason::NoCandidate: return "no_candidate";
        case UnrecognizedReason::BelowThreshold: return "below_threshold";
        case UnrecognizedReason::ClaimedByStrongerMatch: return "claimed_by_stronger_match";
        case UnrecognizedReason::ProcessingFailed: return "processing_failed";
    }
    return "no_candidate";
}

std::optional<AttendanceStatus> parseStatus(const std::string& value) {
    if (value == "present") return AttendanceStatus::Present;
    if (value == "absent") return AttendanceStatus::Absent;
    if (value == "late") return AttendanceStatus::Late;
    return std::nullopt;
}

std::optional<AttendanceMethod> parseMethod(const std::string& value) {
    if (value == "manual") return AttendanceMethod::Manual;
    if (value == "face_match") return AttendanceMethod::FaceMatch;
    return std::nullopt;
}
