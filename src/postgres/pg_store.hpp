#pragma once

#include <memory>

#include "postgres.hpp"
#include "../attendance/attendance_store.hpp"

// Attendance rows and class rosters in PostgreSQL. A commit is a single
// transaction; any failure rolls it back and surfaces as StorageError.
class PgAttendanceStore : public AttendanceStore {
public:
    explicit PgAttendanceStore(std::shared_ptr<Postgres> db);

    std::vector<std::string> loadRoster(const std::string& class_id) override;
    std::vector<AttendanceRecord> loadSession(const std::string& class_id,
                                              const std::string& date) override;
    std::vector<StoredRecord> commit(const std::vector<AttendanceRecord>& records) override;

private:
    std::shared_ptr<Postgres> db_;
};
