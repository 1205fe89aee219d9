#pragma once

#include <stdexcept>
#include <string>

#include "hierarchy/Models.hpp"

namespace hierarchy {

// Raised for vectors that cannot be compared (length mismatch, NaN/Inf).
class SimilarityError : public std::runtime_error {
public:
    explicit SimilarityError(const std::string& what) : std::runtime_error(what) {}
};

// Cosine similarity in [-1, 1].
// Returns 0.0 when either side is absent (empty) or has zero norm.
float cosine_similarity(const Embedding& a, const Embedding& b);

}  // namespace hierarchy
