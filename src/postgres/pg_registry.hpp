#pragma once

#include <memory>

#include "postgres.hpp"
#include "../registry/signature_registry.hpp"

// Signature registry on pgvector. Similarity is 1 - cosine distance,
// clamped to [0, 1]. Connection loss surfaces as RegistryUnavailableError,
// a cancelled statement (statement_timeout) as RegistryTimeoutError.
class PgSignatureRegistry : public SignatureRegistry {
public:
    PgSignatureRegistry(std::shared_ptr<Postgres> db, size_t dimension);

    bool upsert(const std::string& identity_id, const Signature& signature) override;
    std::vector<RegistryMatch> query(const Signature& signature, int top_k) override;
    bool remove(const std::string& identity_id) override;
    size_t size() override;
    size_t dimension() const override { return dimension_; }

private:
    template <typename F>
    auto guarded(const char* operation, F&& f) -> decltype(f(std::declval<pqxx::connection&>()));

    std::shared_ptr<Postgres> db_;
    size_t dimension_;
};
