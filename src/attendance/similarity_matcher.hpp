#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include "types.hpp"
#include "../registry/signature_registry.hpp"
#include "../utils/worker_pool.hpp"

struct MatchSettings {
    float threshold = 0.6f;
    int top_k = 5;
    std::chrono::milliseconds timeout{3000};   // whole batch of per-face queries
    int retries = 2;                           // extra attempts after the first
    std::chrono::milliseconds backoff{200};    // doubles on each retry
};

// Registry answer for one face after threshold filtering.
struct FaceCandidates {
    int face_index = 0;
    bool skipped = false;        // face had no signature, registry not asked
    size_t returned = 0;         // pairs returned by the registry
    std::vector<MatchCandidate> candidates;  // pairs with score >= threshold
};

class SimilarityMatcher {
public:
    SimilarityMatcher(std::shared_ptr<SignatureRegistry> registry, WorkerPool& pool);

    // Queries the registry for every face that carries a signature. Throws
    // RegistryUnavailableError (or RegistryTimeoutError) once all attempts
    // are exhausted.
    std::vector<FaceCandidates> match(const std::vector<DetectedFace>& faces,
                                      const MatchSettings& settings);

private:
    std::vector<FaceCandidates> queryBatch(const std::vector<DetectedFace>& faces,
                                           const MatchSettings& settings);

    std::shared_ptr<SignatureRegistry> registry_;
    WorkerPool& pool_;
};
