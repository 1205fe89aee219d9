#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "hierarchy/RelationshipValidator.hpp"
#include "hierarchy/Summary.hpp"

namespace hierarchy {

nlohmann::json result_to_json(const ValidationResult& r);

struct ReportArtifact {
    std::string data_path;
    std::string cache_path;

    ValidatorConfig cfg;
    ResultFilter filter;
    ValidationSummary summary;  // over all results, before filtering

    std::vector<ValidationResult> results;  // after filtering
    std::vector<Diagnostic> diagnostics;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

}  // namespace hierarchy
