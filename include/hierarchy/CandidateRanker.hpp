#pragma once

#include <string>
#include <vector>

#include "hierarchy/Models.hpp"

namespace hierarchy {

struct Candidate {
    std::string id;
    const Embedding* vector = nullptr;  // nullptr = absent
    size_t payload = 0;                 // caller-defined, typically a record index
};

struct RankedCandidate {
    float score = 0.0f;
    std::string id;
    size_t payload = 0;
};

// Scores every candidate against target, keeps score >= threshold, orders by score
// descending (equal scores keep candidate order) and truncates to top_n.
// Candidates whose vectors cannot be scored are skipped; one Diagnostic per skip is
// appended to diags when given.
std::vector<RankedCandidate> rank_candidates(
    const Embedding& target,
    const std::vector<Candidate>& candidates,
    size_t top_n,
    float threshold,
    std::vector<Diagnostic>* diags = nullptr
);

}  // namespace hierarchy
