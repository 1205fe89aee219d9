#include "hierarchy/Similarity.hpp"

#include <algorithm>
#include <cmath>

namespace hierarchy {

float cosine_similarity(const Embedding& a, const Embedding& b) {
    if (a.empty() || b.empty()) return 0.0f;

    if (a.size() != b.size()) {
        throw SimilarityError("dimension mismatch: " + std::to_string(a.size()) +
                              " vs " + std::to_string(b.size()));
    }

    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        const double x = a[i], y = b[i];
        if (!std::isfinite(x) || !std::isfinite(y)) {
            throw SimilarityError("non-finite component at index " + std::to_string(i));
        }
        dot += x * y;
        na += x * x;
        nb += y * y;
    }
    if (na == 0.0 || nb == 0.0) return 0.0f;

    // rounding can push |cos| a hair past 1
    const double c = dot / (std::sqrt(na) * std::sqrt(nb));
    return static_cast<float>(std::max(-1.0, std::min(1.0, c)));
}

}  // namespace hierarchy
