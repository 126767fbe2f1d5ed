#include "memory_registry.hpp"

#include <algorithm>
#include <stdexcept>

MemorySignatureRegistry::MemorySignatureRegistry(std::size_t dimension)
    : dimension_(dimension) {
    if (dimension_ == 0) {
        throw std::invalid_argument("Registry dimension must be positive");
    }
}

bool MemorySignatureRegistry::upsert(const std::string& identity_id, const Signature& signature) {
    if (signature.size() != dimension_) {
        throw std::invalid_argument("Signature dimension " + std::to_string(signature.size()) +
                                    " does not match registry dimension " + std::to_string(dimension_));
    }
    Signature normalized = signature;
    l2Normalize(normalized);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = signatures_.find(identity_id);
    if (it != signatures_.end()) {
        it->second = std::move(normalized);
        return true;
    }
    signatures_.emplace(identity_id, std::move(normalized));
    return false;
}

std::vector<RegistryMatch> MemorySignatureRegistry::query(const Signature& signature, int top_k) {
    std::vector<RegistryMatch> matches;
    if (top_k <= 0 || signature.size() != dimension_) {
        return matches;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        matches.reserve(signatures_.size());
        for (const auto& entry : signatures_) {
            matches.push_back({entry.first, cosineSimilarity(signature, entry.second)});
        }
    }

    auto better = [](const RegistryMatch& a, const RegistryMatch& b) {
        if (a.similarity_score != b.similarity_score) {
            return a.similarity_score > b.similarity_score;
        }
        return a.identity_id < b.identity_id;
    };
    if (matches.size() > static_cast<size_t>(top_k)) {
        std::partial_sort(matches.begin(), matches.begin() + top_k, matches.end(), better);
        matches.resize(top_k);
    } else {
        std::sort(matches.begin(), matches.end(), better);
    }
    return matches;
}

bool MemorySignatureRegistry::remove(const std::string& identity_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return signatures_.erase(identity_id) > 0;
}

std::size_t MemorySignatureRegistry::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return signatures_.size();
}
