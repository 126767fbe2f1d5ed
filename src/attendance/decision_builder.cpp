#include "decision_builder.hpp"

#include <unordered_map>

WriteAction planWrite(const std::optional<AttendanceRecord>& existing, const AttendanceRecord& incoming) {
    if (!existing) {
        return WriteAction::Inserted;
    }
    if (incoming.method == AttendanceMethod::FaceMatch &&
        incoming.status == AttendanceStatus::Present &&
        existing->status == AttendanceStatus::Absent) {
        return WriteAction::Updated;
    }
    return WriteAction::Unchanged;
}

AttendanceRecord mergeRecord(const AttendanceRecord& existing, const AttendanceRecord& incoming) {
    AttendanceRecord merged = incoming;
    merged.created_at = existing.created_at;
    return merged;
}

std::vector<AttendanceDecision> DecisionBuilder::build(const SessionContext& session,
                                                       const std::vector<ResolvedMatch>& resolved,
                                                       const std::vector<std::string>& roster,
                                                       const std::vector<AttendanceRecord>& existing) const {
    std::unordered_map<std::string, const ResolvedMatch*> matched;
    for (const auto& r : resolved) {
        matched[r.identity_id] = &r;
    }
    std::unordered_map<std::string, const AttendanceRecord*> prior;
    for (const auto& rec : existing) {
        if (rec.class_id == session.class_id && rec.date == session.date) {
            prior[rec.identity_id] = &rec;
        }
    }

    std::vector<AttendanceDecision> decisions;
    decisions.reserve(roster.size());
    for (const auto& identity_id : roster) {
        AttendanceDecision d;
        d.record.class_id = session.class_id;
        d.record.identity_id = identity_id;
        d.record.date = session.date;
        d.record.marked_by = session.marked_by;

        auto m = matched.find(identity_id);
        if (m != matched.end()) {
            d.record.status = AttendanceStatus::Present;
            d.record.method = AttendanceMethod::FaceMatch;
            d.record.confidence_score = m->second->similarity_score;
        } else {
            d.record.status = AttendanceStatus::Absent;
            d.record.method = AttendanceMethod::Manual;
        }

        auto p = prior.find(identity_id);
        if (p != prior.end()) {
            d.existing = *p->second;
        }
        d.planned = planWrite(d.existing, d.record);
        decisions.push_back(std::move(d));
    }
    return decisions;
}
