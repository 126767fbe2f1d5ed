#include "assignment_resolver.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

std::vector<ResolvedMatch> AssignmentResolver::resolve(std::vector<MatchCandidate> candidates) const {
    std::sort(candidates.begin(), candidates.end(),
              [](const MatchCandidate& a, const MatchCandidate& b) {
                  if (a.similarity_score != b.similarity_score) {
                      return a.similarity_score > b.similarity_score;
                  }
                  if (a.face_index != b.face_index) {
                      return a.face_index < b.face_index;
                  }
                  return a.identity_id < b.identity_id;
              });

    std::unordered_set<int> claimed_faces;
    std::unordered_set<std::string> claimed_identities;
    std::vector<ResolvedMatch> resolved;

    for (const auto& c : candidates) {
        if (claimed_faces.count(c.face_index) || claimed_identities.count(c.identity_id)) {
            continue;
        }
        claimed_faces.insert(c.face_index);
        claimed_identities.insert(c.identity_id);
        resolved.push_back({c.face_index, c.identity_id, c.similarity_score});
    }

    std::sort(resolved.begin(), resolved.end(),
              [](const ResolvedMatch& a, const ResolvedMatch& b) { return a.face_index < b.face_index; });
    return resolved;
}

std::vector<FaceResolution> AssignmentResolver::describe(const std::vector<DetectedFace>& faces,
                                                         const std::vector<FaceCandidates>& candidates,
                                                         const std::vector<ResolvedMatch>& resolved) const {
    std::unordered_map<int, const ResolvedMatch*> by_face;
    for (const auto& r : resolved) {
        by_face[r.face_index] = &r;
    }
    std::unordered_map<int, const FaceCandidates*> candidates_by_face;
    for (const auto& c : candidates) {
        candidates_by_face[c.face_index] = &c;
    }

    std::vector<FaceResolution> out;
    out.reserve(faces.size());
    for (const auto& face : faces) {
        FaceResolution fr;
        fr.face_index = face.face_index;
        fr.box = face.box;

        auto hit = by_face.find(face.face_index);
        if (hit != by_face.end()) {
            fr.outcome = Recognized{hit->second->identity_id, hit->second->similarity_score};
        } else {
            auto it = candidates_by_face.find(face.face_index);
            UnrecognizedReason reason = UnrecognizedReason::ProcessingFailed;
            if (it != candidates_by_face.end() && !it->second->skipped) {
                if (it->second->returned == 0) {
                    reason = UnrecognizedReason::NoCandidate;
                } else if (it->second->candidates.empty()) {
                    reason = UnrecognizedReason::BelowThreshold;
                } else {
                    reason = UnrecognizedReason::ClaimedByStrongerMatch;
                }
            }
            fr.outcome = Unrecognized{reason};
        }
        out.push_back(std::move(fr));
    }

    std::sort(out.begin(), out.end(),
              [](const FaceResolution& a, const FaceResolution& b) { return a.face_index < b.face_index; });
    return out;
}
