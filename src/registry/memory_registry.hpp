#pragma once

#include <mutex>
#include <unordered_map>

#include "signature_registry.hpp"

// In-process registry with brute-force search. Used for the `memory`
// storage backend and in tests.
class MemorySignatureRegistry : public SignatureRegistry {
public:
    explicit MemorySignatureRegistry(std::size_t dimension);

    bool upsert(const std::string& identity_id, const Signature& signature) override;
    std::vector<RegistryMatch> query(const Signature& signature, int top_k) override;
    bool remove(const std::string& identity_id) override;
    std::size_t size() override;
    std::size_t dimension() const override { return dimension_; }

private:
    std::size_t dimension_;
    std::unordered_map<std::string, Signature> signatures_;
    std::mutex mutex_;
};
