#pragma once

#include <vector>

#include "similarity_matcher.hpp"
#include "types.hpp"

// Greedy one-to-one assignment of faces to identities for one photo.
//
// Candidates are visited by descending similarity; exact ties are visited
// by ascending face_index, then ascending identity_id. A candidate is
// accepted only when neither its face nor its identity has been claimed.
// The result therefore holds each face_index and each identity_id at most
// once, and repeated runs over the same input give the same assignment.
class AssignmentResolver {
public:
    // Returned matches are ordered by face_index.
    std::vector<ResolvedMatch> resolve(std::vector<MatchCandidate> candidates) const;

    // Per-face outcome for every detected face, in face_index order.
    std::vector<FaceResolution> describe(const std::vector<DetectedFace>& faces,
                                         const std::vector<FaceCandidates>& candidates,
                                         const std::vector<ResolvedMatch>& resolved) const;
};
