#include "pg_store.hpp"
#include "../attendance/decision_builder.hpp"
#include "../attendance/errors.hpp"

#include <optional>

namespace {

const char* kRecordColumns =
    "class_id, identity_id, to_char(date, 'YYYY-MM-DD') AS date, status, method, "
    "confidence_score, marked_by, to_char(created_at, 'YYYY-MM-DD HH24:MI:SS') AS created_at";

AttendanceRecord rowToRecord(const pqxx::row& row) {
    AttendanceRecord record;
    record.class_id = row["class_id"].as<std::string>();
    record.identity_id = row["identity_id"].as<std::string>();
    record.date = row["date"].as<std::string>();
    record.status = parseStatus(row["status"].as<std::string>()).value_or(AttendanceStatus::Absent);
    record.method = parseMethod(row["method"].as<std::string>()).value_or(AttendanceMethod::Manual);
    if (!row["confidence_score"].is_null()) {
        record.confidence_score = row["confidence_score"].as<float>();
    }
    record.marked_by = row["marked_by"].as<std::string>();
    record.created_at = row["created_at"].as<std::string>();
    return record;
}

template <typename F>
auto guarded(Postgres& db, const char* operation, F&& f) -> decltype(f(std::declval<pqxx::connection&>())) {
    try {
        return db.run(std::forward<F>(f));
    } catch (const pqxx::failure& e) {
        throw StorageError(std::string(operation) + " failed: " + e.what());
    } catch (const pqxx::usage_error& e) {
        throw StorageError(std::string(operation) + " failed: " + e.what());
    }
}

}

PgAttendanceStore::PgAttendanceStore(std::shared_ptr<Postgres> db) : db_(std::move(db)) {
}

std::vector<std::string> PgAttendanceStore::loadRoster(const std::string& class_id) {
    return guarded(*db_, "load roster", [&](pqxx::connection& c) {
        pqxx::read_transaction txn(c);
        pqxx::result r = txn.exec_params(
            "SELECT identity_id FROM class_enrollments WHERE class_id = $1 "
            "ORDER BY identity_id COLLATE \"C\"",
            class_id
        );
        std::vector<std::string> roster;
        roster.reserve(r.size());
        for (const auto& row : r) {
            roster.push_back(row[0].as<std::string>());
        }
        return roster;
    });
}

std::vector<AttendanceRecord> PgAttendanceStore::loadSession(const std::string& class_id,
                                                             const std::string& date) {
    return guarded(*db_, "load session", [&](pqxx::connection& c) {
        pqxx::read_transaction txn(c);
        pqxx::result r = txn.exec_params(
            std::string("SELECT ") + kRecordColumns +
            " FROM attendance WHERE class_id = $1 AND date = $2::date "
            "ORDER BY identity_id COLLATE \"C\"",
            class_id,
            date
        );
        std::vector<AttendanceRecord> records;
        records.reserve(r.size());
        for (const auto& row : r) {
            records.push_back(rowToRecord(row));
        }
        return records;
    });
}

// Each record is inserted if absent. When a row already exists it is
// locked and planWrite() decides whether it is upgraded, so concurrent
// submissions for the same session serialise on the row.
std::vector<StoredRecord> PgAttendanceStore::commit(const std::vector<AttendanceRecord>& records) {
    return guarded(*db_, "commit attendance", [&](pqxx::connection& c) {
        pqxx::work txn(c);
        std::vector<StoredRecord> results;
        results.reserve(records.size());

        for (const auto& incoming : records) {
            std::optional<float> confidence = incoming.confidence_score;
            StoredRecord result;

            pqxx::result inserted = txn.exec_params(
                "INSERT INTO attendance(class_id, identity_id, date, status, method, confidence_score, marked_by) "
                "VALUES ($1, $2, $3::date, $4, $5, $6, $7) "
                "ON CONFLICT (class_id, identity_id, date) DO NOTHING "
                "RETURNING " + std::string(kRecordColumns),
                incoming.class_id,
                incoming.identity_id,
                incoming.date,
                std::string(toString(incoming.status)),
                std::string(toString(incoming.method)),
                confidence,
                incoming.marked_by
            );
            if (!inserted.empty()) {
                result.record = rowToRecord(inserted[0]);
                result.action = WriteAction::Inserted;
                results.push_back(std::move(result));
                continue;
            }

            pqxx::result current = txn.exec_params(
                std::string("SELECT ") + kRecordColumns +
                " FROM attendance WHERE class_id = $1 AND identity_id = $2 AND date = $3::date FOR UPDATE",
                incoming.class_id,
                incoming.identity_id,
                incoming.date
            );
            if (current.empty()) {
                throw StorageError("Attendance row for " + incoming.identity_id + " vanished during commit");
            }
            AttendanceRecord existing = rowToRecord(current[0]);

            result.action = planWrite(existing, incoming);
            if (result.action == WriteAction::Updated) {
                AttendanceRecord merged = mergeRecord(existing, incoming);
                pqxx::result updated = txn.exec_params(
                    "UPDATE attendance SET status = $4, method = $5, confidence_score = $6, "
                    "marked_by = $7, updated_at = now() "
                    "WHERE class_id = $1 AND identity_id = $2 AND date = $3::date "
                    "RETURNING " + std::string(kRecordColumns),
                    merged.class_id,
                    merged.identity_id,
                    merged.date,
                    std::string(toString(merged.status)),
                    std::string(toString(merged.method)),
                    merged.confidence_score,
                    merged.marked_by
                );
                result.record = rowToRecord(updated[0]);
            } else {
                result.record = existing;
            }
            results.push_back(std::move(result));
        }

        txn.commit();
        return results;
    });
}
