#pragma once

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

// What committing `incoming` over `existing` does:
//  - no existing row                         -> Inserted
//  - face-match present over an absent row   -> Updated
//  - anything else                           -> Unchanged
// A face match never downgrades a present/late row and an inferred absence
// never overwrites any row.
WriteAction planWrite(const std::optional<AttendanceRecord>& existing, const AttendanceRecord& incoming);

// Row that results from an Updated plan. Keeps the original created_at.
AttendanceRecord mergeRecord(const AttendanceRecord& existing, const AttendanceRecord& incoming);

struct AttendanceDecision {
    AttendanceRecord record;               // record to commit
    WriteAction planned = WriteAction::Unchanged;
    std::optional<AttendanceRecord> existing;
};

class DecisionBuilder {
public:
    // One decision per roster identity, in roster order. Identities in
    // `resolved` that are not on the roster are ignored here.
    std::vector<AttendanceDecision> build(const SessionContext& session,
                                          const std::vector<ResolvedMatch>& resolved,
                                          const std::vector<std::string>& roster,
                                          const std::vector<AttendanceRecord>& existing) const;
};
