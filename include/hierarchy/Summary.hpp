#pragma once

#include <string>
#include <vector>

#include "hierarchy/Models.hpp"

namespace hierarchy {

struct ValidationSummary {
    size_t total = 0;
    size_t valid = 0;
    size_t invalid = 0;
    double pass_rate = 0.0;          // valid / total, 0 when total == 0

    size_t suggestion_count = 0;
    double mean_improvement = 0.0;   // over all suggestions, 0 when none
    size_t improvable = 0;           // results with a suggestion scoring above the current parent
};

ValidationSummary summarize(const std::vector<ValidationResult>& results);

enum class StatusFilter {
    All,
    Valid,
    Invalid
};

struct ResultFilter {
    StatusFilter status = StatusFilter::All;
    float min_score = 0.0f;  // on current_parent.similarity_score
};

// "all" / "valid" / "invalid" (case-insensitive); false on anything else
bool parse_status_filter(const std::string& s, StatusFilter& out);
const char* status_filter_str(StatusFilter f);

std::vector<ValidationResult> filter_results(const std::vector<ValidationResult>& results,
                                             const ResultFilter& f);

// One row per suggestion, flattened across results.
struct ImprovementRow {
    std::string root_key;
    std::string root_name;
    std::string current_parent;
    float current_score = 0.0f;
    std::string suggested_parent_key;
    std::string suggested_parent;
    float similarity_score = 0.0f;
    float improvement = 0.0f;
};

// Ordered by improvement descending; ties keep result/suggestion order.
std::vector<ImprovementRow> improvement_rows(const std::vector<ValidationResult>& results);

}  // namespace hierarchy
