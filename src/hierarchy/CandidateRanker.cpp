#include "hierarchy/CandidateRanker.hpp"

#include "hierarchy/Similarity.hpp"

#include <algorithm>

namespace hierarchy {

std::vector<RankedCandidate> rank_candidates(
    const Embedding& target,
    const std::vector<Candidate>& candidates,
    size_t top_n,
    float threshold,
    std::vector<Diagnostic>* diags
) {
    std::vector<RankedCandidate> hits;
    if (top_n == 0) return hits;

    static const Embedding kAbsent;

    hits.reserve(candidates.size());
    for (const auto& c : candidates) {
        float s = 0.0f;
        try {
            s = cosine_similarity(target, c.vector ? *c.vector : kAbsent);
        } catch (const SimilarityError& e) {
            if (diags) {
                diags->push_back(Diagnostic{"candidate_skipped",
                                            "candidate " + c.id + ": " + e.what(), ""});
            }
            continue;
        }
        if (s < threshold) continue;
        hits.push_back(RankedCandidate{s, c.id, c.payload});
    }

    std::stable_sort(hits.begin(), hits.end(),
                     [](const RankedCandidate& a, const RankedCandidate& b) { return a.score > b.score; });

    if (hits.size() > top_n) hits.resize(top_n);
    return hits;
}

}  // namespace hierarchy
