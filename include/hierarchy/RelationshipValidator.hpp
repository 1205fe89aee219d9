#pragma once

#include <string>
#include <vector>

#include "hierarchy/Models.hpp"

namespace hierarchy {

struct ValidatorConfig {
    float validity_threshold = 0.65f;   // current parent VALID if score >= this
    float suggestion_threshold = 0.65f; // alternative listed if score >= this
    size_t top_n = 3;                   // max suggestions per record
};

// One result per record with a parent_name, in record order.
// Throws InputError when the embedding table is not aligned with records.
std::vector<ValidationResult> validate_relationships(
    const std::vector<NodeRecord>& records,
    const EmbeddingTable& embeddings,
    const ValidatorConfig& cfg = {},
    std::vector<Diagnostic>* diags = nullptr
);

}  // namespace hierarchy
