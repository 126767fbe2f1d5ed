#include "pg_registry.hpp"
#include "../attendance/errors.hpp"

#include <stdexcept>

PgSignatureRegistry::PgSignatureRegistry(std::shared_ptr<Postgres> db, size_t dimension)
    : db_(std::move(db)), dimension_(dimension) {
}

template <typename F>
auto PgSignatureRegistry::guarded(const char* operation, F&& f)
    -> decltype(f(std::declval<pqxx::connection&>())) {
    try {
        return db_->run(std::forward<F>(f));
    } catch (const pqxx::query_canceled& e) {
        throw RegistryTimeoutError(std::string(operation) + " timed out: " + e.what());
    } catch (const pqxx::broken_connection& e) {
        throw RegistryUnavailableError(std::string(operation) + ": connection lost: " + e.what());
    } catch (const pqxx::failure& e) {
        throw RegistryUnavailableError(std::string(operation) + " failed: " + e.what());
    }
}

bool PgSignatureRegistry::upsert(const std::string& identity_id, const Signature& signature) {
    if (signature.size() != dimension_) {
        throw std::invalid_argument("Signature dimension " + std::to_string(signature.size()) +
                                    " does not match registry dimension " + std::to_string(dimension_));
    }
    Signature normalized = signature;
    l2Normalize(normalized);
    std::string vector_text = vec2pgvector(normalized);

    return guarded("upsert", [&](pqxx::connection& c) {
        pqxx::work txn(c);
        pqxx::result r = txn.exec_params(
            "INSERT INTO face_signatures(identity_id, embedding, updated_at) "
            "VALUES ($1, $2::vector, now()) "
            "ON CONFLICT (identity_id) DO UPDATE "
            "SET embedding = EXCLUDED.embedding, updated_at = now() "
            "RETURNING (xmax <> 0) AS replaced",
            identity_id,
            vector_text
        );
        txn.commit();
        return r[0]["replaced"].as<bool>();
    });
}

std::vector<RegistryMatch> PgSignatureRegistry::query(const Signature& signature, int top_k) {
    if (top_k <= 0 || signature.size() != dimension_) {
        return {};
    }
    std::string vector_text = vec2pgvector(signature);

    return guarded("query", [&](pqxx::connection& c) {
        pqxx::read_transaction txn(c);
        pqxx::result r = txn.exec_params(
            "SELECT identity_id, "
            "       LEAST(1, GREATEST(0, 1 - (embedding <=> $1::vector))) AS similarity "
            "FROM face_signatures "
            "ORDER BY embedding <=> $1::vector, identity_id COLLATE \"C\" "
            "LIMIT $2",
            vector_text,
            top_k
        );
        std::vector<RegistryMatch> matches;
        matches.reserve(r.size());
        for (const auto& row : r) {
            matches.push_back({row["identity_id"].as<std::string>(), row["similarity"].as<float>()});
        }
        return matches;
    });
}

bool PgSignatureRegistry::remove(const std::string& identity_id) {
    return guarded("remove", [&](pqxx::connection& c) {
        pqxx::work txn(c);
        pqxx::result r = txn.exec_params("DELETE FROM face_signatures WHERE identity_id = $1", identity_id);
        txn.commit();
        return r.affected_rows() > 0;
    });
}

size_t PgSignatureRegistry::size() {
    return guarded("size", [](pqxx::connection& c) {
        pqxx::read_transaction txn(c);
        return txn.query_value<size_t>("SELECT count(*) FROM face_signatures");
    });
}
