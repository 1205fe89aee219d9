#include "hierarchy/RelationshipValidator.hpp"

#include "hierarchy/CandidateRanker.hpp"
#include "hierarchy/Similarity.hpp"

#include <string>
#include <vector>

namespace hierarchy {

static void require_aligned(const std::vector<NodeRecord>& records, const EmbeddingTable& emb) {
    if (emb.root.size() != records.size()) {
        throw InputError("embedding table has " + std::to_string(emb.root.size()) +
                         " root vectors but dataset has " + std::to_string(records.size()) +
                         " records (stale embedding cache?)");
    }
    if (emb.parent.size() != records.size()) {
        throw InputError("embedding table has " + std::to_string(emb.parent.size()) +
                         " parent vectors but dataset has " + std::to_string(records.size()) +
                         " records (stale embedding cache?)");
    }
}

static float current_score(const NodeRecord& r, const Embedding& root, const Embedding& parent,
                           std::vector<Diagnostic>* diags) {
    try {
        return cosine_similarity(root, parent);
    } catch (const SimilarityError& e) {
        if (diags) diags->push_back(Diagnostic{"current_score_failed", e.what(), r.root_key});
        return 0.0f;
    }
}

std::vector<ValidationResult> validate_relationships(
    const std::vector<NodeRecord>& records,
    const EmbeddingTable& embeddings,
    const ValidatorConfig& cfg,
    std::vector<Diagnostic>* diags
) {
    require_aligned(records, embeddings);

    // Parent-bearing records, in dataset order. Only these can be suggested, and a
    // suggestion names the candidate's declared parent since parent[j] embeds its summary.
    std::vector<size_t> eligible;
    eligible.reserve(records.size());
    for (size_t j = 0; j < records.size(); ++j) {
        if (records[j].has_parent()) eligible.push_back(j);
    }

    std::vector<ValidationResult> results;
    results.reserve(eligible.size());

    std::vector<Candidate> pool;
    pool.reserve(eligible.size());

    std::vector<Diagnostic> local;

    for (size_t i : eligible) {
        const NodeRecord& rec = records[i];
        const Embedding& root_vec = embeddings.root[i];

        const float score = current_score(rec, root_vec, embeddings.parent[i], diags);

        pool.clear();
        for (size_t j : eligible) {
            if (j == i) continue;
            pool.push_back(Candidate{records[j].root_key, &embeddings.parent[j], j});
        }

        local.clear();
        const auto ranked = rank_candidates(root_vec, pool, cfg.top_n, cfg.suggestion_threshold,
                                            diags ? &local : nullptr);
        for (auto& d : local) {
            d.root_key = rec.root_key;
            diags->push_back(std::move(d));
        }

        ValidationResult res;
        res.root_key = rec.root_key;
        res.root_name = rec.root_name;
        res.current_parent = ParentRef{rec.parent_key, rec.parent_name, score};

        res.suggested_parents.reserve(ranked.size());
        for (const auto& h : ranked) {
            const NodeRecord& cand = records[h.payload];
            res.suggested_parents.push_back(
                SuggestedParent{cand.parent_key, cand.parent_name, h.score, h.score - score, cand.root_key});
        }

        res.validation = (score >= cfg.validity_threshold) ? Verdict::Valid : Verdict::Invalid;
        results.push_back(std::move(res));
    }

    return results;
}

}  // namespace hierarchy
