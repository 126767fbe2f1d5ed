#pragma once

#include <map>
#include <mutex>
#include <set>
#include <tuple>

#include "attendance_store.hpp"

// In-process attendance store. Commits run under one lock against a copy
// of the table, so a failed commit leaves no partial rows.
class MemoryAttendanceStore : public AttendanceStore {
public:
    void addToRoster(const std::string& class_id, const std::string& identity_id);

    // Reads "class_id,identity_id" lines. Returns the number of entries
    // added; throws StorageError when the file cannot be opened.
    size_t loadRosterFile(const std::string& path);

    // Writes a row directly, as an external manual correction would.
    void putRecord(const AttendanceRecord& record);

    // Makes the next commit throw StorageError after staging its rows.
    void failNextCommit();

    size_t recordCount();

    std::vector<std::string> loadRoster(const std::string& class_id) override;
    std::vector<AttendanceRecord> loadSession(const std::string& class_id,
                                              const std::string& date) override;
    std::vector<StoredRecord> commit(const std::vector<AttendanceRecord>& records) override;

private:
    using Key = std::tuple<std::string, std::string, std::string>;  // class, identity, date

    std::map<std::string, std::set<std::string>> rosters_;
    std::map<Key, AttendanceRecord> records_;
    bool fail_next_commit_ = false;
    std::mutex mutex_;
};
