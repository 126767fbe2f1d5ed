#include "signature_registry.hpp"

#include <algorithm>
#include <cmath>

float cosineSimilarity(const Signature& a, const Signature& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0f;
    }
    double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }
    if (norm_a <= 1e-12 || norm_b <= 1e-12) {
        return 0.0f;
    }
    double sim = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
    return static_cast<float>(std::clamp(sim, 0.0, 1.0));
}

void l2Normalize(Signature& v) {
    double sq_sum = 0.0;
    for (float x : v) {
        sq_sum += static_cast<double>(x) * x;
    }
    double norm = std::sqrt(sq_sum);
    if (norm > 1e-6) {
        for (float& x : v) {
            x = static_cast<float>(x / norm);
        }
    }
}
