#include "similarity_matcher.hpp"
#include "errors.hpp"

#include <future>
#include <iostream>
#include <thread>

SimilarityMatcher::SimilarityMatcher(std::shared_ptr<SignatureRegistry> registry, WorkerPool& pool)
    : registry_(std::move(registry)), pool_(pool) {
}

std::vector<FaceCandidates> SimilarityMatcher::match(const std::vector<DetectedFace>& faces,
                                                     const MatchSettings& settings) {
    std::chrono::milliseconds backoff = settings.backoff;
    for (int attempt = 0;; ++attempt) {
        try {
            return queryBatch(faces, settings);
        } catch (const RegistryUnavailableError& e) {
            if (attempt >= settings.retries) {
                std::cerr << "[matcher] Registry failed after " << (attempt + 1)
                          << " attempt(s): " << e.what() << std::endl;
                throw;
            }
            std::cerr << "[matcher] Registry attempt " << (attempt + 1) << " failed: " << e.what()
                      << ", retrying in " << backoff.count() << " ms" << std::endl;
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }
}

std::vector<FaceCandidates> SimilarityMatcher::queryBatch(const std::vector<DetectedFace>& faces,
                                                          const MatchSettings& settings) {
    std::vector<FaceCandidates> results(faces.size());
    std::vector<std::future<std::vector<RegistryMatch>>> pending(faces.size());

    for (size_t i = 0; i < faces.size(); ++i) {
        results[i].face_index = faces[i].face_index;
        if (faces[i].signature.empty()) {
            results[i].skipped = true;
            continue;
        }
        auto registry = registry_;
        Signature signature = faces[i].signature;
        int top_k = settings.top_k;
        pending[i] = pool_.submit([registry, signature, top_k] {
            return registry->query(signature, top_k);
        });
    }

    // One deadline for the whole batch.
    auto deadline = std::chrono::steady_clock::now() + settings.timeout;
    for (size_t i = 0; i < faces.size(); ++i) {
        if (results[i].skipped) {
            continue;
        }
        if (pending[i].wait_until(deadline) != std::future_status::ready) {
            throw RegistryTimeoutError("Registry query batch exceeded " +
                                       std::to_string(settings.timeout.count()) + " ms");
        }

        std::vector<RegistryMatch> matches;
        try {
            matches = pending[i].get();
        } catch (const RegistryUnavailableError&) {
            throw;
        } catch (const std::exception& e) {
            throw RegistryUnavailableError(std::string("Registry query failed: ") + e.what());
        }

        results[i].returned = matches.size();
        for (const auto& m : matches) {
            if (m.similarity_score >= settings.threshold) {
                results[i].candidates.push_back({faces[i].face_index, m.identity_id, m.similarity_score});
            }
        }
    }
    return results;
}
