#include "memory_store.hpp"
#include "decision_builder.hpp"
#include "errors.hpp"
#include "../utils/date_utils.hpp"

#include <fstream>
#include <iostream>

void MemoryAttendanceStore::addToRoster(const std::string& class_id, const std::string& identity_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    rosters_[class_id].insert(identity_id);
}

size_t MemoryAttendanceStore::loadRosterFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw StorageError("Failed to open roster file: " + path);
    }

    size_t added = 0;
    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        line.erase(line.find_last_not_of(" \n\r\t") + 1);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        size_t comma = line.find(',');
        if (comma == std::string::npos || comma == 0 || comma + 1 == line.size()) {
            std::cerr << "[store] Skipping malformed roster line " << line_no << std::endl;
            continue;
        }
        addToRoster(line.substr(0, comma), line.substr(comma + 1));
        ++added;
    }
    return added;
}

void MemoryAttendanceStore::putRecord(const AttendanceRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    AttendanceRecord stored = record;
    if (stored.created_at.empty()) {
        stored.created_at = currentTimestamp();
    }
    records_[Key{record.class_id, record.identity_id, record.date}] = stored;
}

void MemoryAttendanceStore::failNextCommit() {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_next_commit_ = true;
}

size_t MemoryAttendanceStore::recordCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::vector<std::string> MemoryAttendanceStore::loadRoster(const std::string& class_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rosters_.find(class_id);
    if (it == rosters_.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<AttendanceRecord> MemoryAttendanceStore::loadSession(const std::string& class_id,
                                                                 const std::string& date) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AttendanceRecord> out;
    for (const auto& entry : records_) {
        if (std::get<0>(entry.first) == class_id && std::get<2>(entry.first) == date) {
            out.push_back(entry.second);
        }
    }
    return out;
}

std::vector<StoredRecord> MemoryAttendanceStore::commit(const std::vector<AttendanceRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto staged = records_;
    std::vector<StoredRecord> results;
    results.reserve(records.size());

    for (const auto& incoming : records) {
        Key key{incoming.class_id, incoming.identity_id, incoming.date};
        auto it = staged.find(key);
        std::optional<AttendanceRecord> existing;
        if (it != staged.end()) {
            existing = it->second;
        }

        StoredRecord result;
        result.action = planWrite(existing, incoming);
        switch (result.action) {
            case WriteAction::Inserted:
                result.record = incoming;
                result.record.created_at = currentTimestamp();
                staged[key] = result.record;
                break;
            case WriteAction::Updated:
                result.record = mergeRecord(*existing, incoming);
                staged[key] = result.record;
                break;
            case WriteAction::Unchanged:
                result.record = *existing;
                break;
        }
        results.push_back(std::move(result));
    }

    if (fail_next_commit_) {
        fail_next_commit_ = false;
        throw StorageError("Injected commit failure");
    }
    records_.swap(staged);
    return results;
}
