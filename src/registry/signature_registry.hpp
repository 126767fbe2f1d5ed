#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "../attendance/types.hpp"

// Keyed store of one live signature per enrolled identity. Implementations
// may be remote; failures surface as RegistryUnavailableError.
class SignatureRegistry {
public:
    virtual ~SignatureRegistry() = default;

    // Replaces any previous signature for identity_id. Returns true when a
    // previous signature existed.
    virtual bool upsert(const std::string& identity_id, const Signature& signature) = 0;

    // Up to top_k identities ordered by descending similarity, ties broken
    // by ascending identity_id.
    virtual std::vector<RegistryMatch> query(const Signature& signature, int top_k) = 0;

    // Returns true when a signature was removed.
    virtual bool remove(const std::string& identity_id) = 0;

    virtual std::size_t size() = 0;

    virtual std::size_t dimension() const = 0;
};

// Cosine similarity clamped to [0, 1]. Inputs need not be normalised.
float cosineSimilarity(const Signature& a, const Signature& b);

// Scales v to unit length in place. Zero vectors are left untouched.
void l2Normalize(Signature& v);
