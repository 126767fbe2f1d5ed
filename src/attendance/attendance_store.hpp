#pragma once

#include <string>
#include <vector>

#include "types.hpp"

struct StoredRecord {
    AttendanceRecord record;   // row as it stands after the commit
    WriteAction action = WriteAction::Unchanged;
};

// Persistence collaborator for rosters and attendance rows. Rows are unique
// on (class_id, identity_id, date).
class AttendanceStore {
public:
    virtual ~AttendanceStore() = default;

    // Enrolled identities of the class, sorted.
    virtual std::vector<std::string> loadRoster(const std::string& class_id) = 0;

    virtual std::vector<AttendanceRecord> loadSession(const std::string& class_id,
                                                      const std::string& date) = 0;

    // Applies every record with insert-if-absent and the conflict policy of
    // planWrite(), all or nothing. Throws StorageError and writes nothing on
    // failure. Results are in input order.
    virtual std::vector<StoredRecord> commit(const std::vector<AttendanceRecord>& records) = 0;
};
