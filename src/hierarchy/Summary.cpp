#include "hierarchy/Summary.hpp"

#include <algorithm>
#include <cctype>

namespace hierarchy {

ValidationSummary summarize(const std::vector<ValidationResult>& results) {
    ValidationSummary s;
    s.total = results.size();

    double improvement_sum = 0.0;
    for (const auto& r : results) {
        if (r.valid()) ++s.valid;
        else ++s.invalid;

        bool better = false;
        for (const auto& sp : r.suggested_parents) {
            ++s.suggestion_count;
            improvement_sum += sp.improvement;
            if (sp.improvement > 0.0f) better = true;
        }
        if (better) ++s.improvable;
    }

    if (s.total > 0) s.pass_rate = static_cast<double>(s.valid) / static_cast<double>(s.total);
    if (s.suggestion_count > 0) s.mean_improvement = improvement_sum / static_cast<double>(s.suggestion_count);
    return s;
}

static std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool parse_status_filter(const std::string& s, StatusFilter& out) {
    const std::string k = to_lower_copy(s);
    if (k == "all") { out = StatusFilter::All; return true; }
    if (k == "valid") { out = StatusFilter::Valid; return true; }
    if (k == "invalid") { out = StatusFilter::Invalid; return true; }
    return false;
}

const char* status_filter_str(StatusFilter f) {
    switch (f) {
        case StatusFilter::Valid: return "VALID";
        case StatusFilter::Invalid: return "INVALID";
        default: return "ALL";
    }
}

std::vector<ValidationResult> filter_results(const std::vector<ValidationResult>& results,
                                             const ResultFilter& f) {
    std::vector<ValidationResult> out;
    out.reserve(results.size());

    for (const auto& r : results) {
        if (f.status == StatusFilter::Valid && !r.valid()) continue;
        if (f.status == StatusFilter::Invalid && r.valid()) continue;
        if (r.current_parent.similarity_score < f.min_score) continue;
        out.push_back(r);
    }
    return out;
}

std::vector<ImprovementRow> improvement_rows(const std::vector<ValidationResult>& results) {
    std::vector<ImprovementRow> rows;

    for (const auto& r : results) {
        for (const auto& sp : r.suggested_parents) {
            ImprovementRow row;
            row.root_key = r.root_key;
            row.root_name = r.root_name;
            row.current_parent = r.current_parent.parent_name;
            row.current_score = r.current_parent.similarity_score;
            row.suggested_parent_key = sp.parent_key;
            row.suggested_parent = sp.parent_name;
            row.similarity_score = sp.similarity_score;
            row.improvement = sp.improvement;
            rows.push_back(std::move(row));
        }
    }

    std::stable_sort(rows.begin(), rows.end(),
                     [](const ImprovementRow& a, const ImprovementRow& b) { return a.improvement > b.improvement; });
    return rows;
}

}  // namespace hierarchy
