#include "postgres.hpp"

#include <iostream>

Postgres::Postgres(const std::string& conninfo) : conninfo(conninfo) {
}

Postgres::~Postgres() {
    if (conn) {
        conn->close();
    }
}

pqxx::connection& Postgres::connection() {
    if (conn && !conn->is_open()) {
        conn.reset();
    }
    if (!conn) {
        conn = std::make_unique<pqxx::connection>(conninfo);
        std::cout << "[postgres] Connected to " << conn->dbname() << std::endl;
    }
    return *conn;
}

void Postgres::ensure_schema(size_t embedding_dim) {
    run([embedding_dim](pqxx::connection& c) {
        pqxx::work txn(c);
        txn.exec("CREATE EXTENSION IF NOT EXISTS vector");
        txn.exec(
            "CREATE TABLE IF NOT EXISTS face_signatures ("
            "   identity_id TEXT PRIMARY KEY,"
            "   embedding vector(" + std::to_string(embedding_dim) + ") NOT NULL,"
            "   updated_at TIMESTAMP NOT NULL DEFAULT now()"
            ")");
        txn.exec(
            "CREATE TABLE IF NOT EXISTS class_enrollments ("
            "   class_id TEXT NOT NULL,"
            "   identity_id TEXT NOT NULL,"
            "   PRIMARY KEY (class_id, identity_id)"
            ")");
        txn.exec(
            "CREATE TABLE IF NOT EXISTS attendance ("
            "   id BIGSERIAL PRIMARY KEY,"
            "   class_id TEXT NOT NULL,"
            "   identity_id TEXT NOT NULL,"
            "   date DATE NOT NULL,"
            "   status TEXT NOT NULL CHECK (status IN ('present', 'absent', 'late')),"
            "   method TEXT NOT NULL CHECK (method IN ('manual', 'face_match')),"
            "   confidence_score REAL,"
            "   marked_by TEXT NOT NULL DEFAULT '',"
            "   created_at TIMESTAMP NOT NULL DEFAULT now(),"
            "   updated_at TIMESTAMP NOT NULL DEFAULT now(),"
            "   UNIQUE (class_id, identity_id, date)"
            ")");
        txn.commit();
    });
    std::cout << "[postgres] Schema ready (embedding dimension " << embedding_dim << ")" << std::endl;
}
