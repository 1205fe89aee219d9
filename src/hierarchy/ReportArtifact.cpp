#include "hierarchy/ReportArtifact.hpp"

#include <fstream>
#include <stdexcept>

namespace hierarchy {

nlohmann::json result_to_json(const ValidationResult& r) {
    nlohmann::json j;

    j["root_key"] = r.root_key;
    j["root_name"] = r.root_name;

    j["current_parent"] = {
        {"parent_key", r.current_parent.parent_key},
        {"parent_name", r.current_parent.parent_name},
        {"similarity_score", r.current_parent.similarity_score}
    };

    nlohmann::json suggestions = nlohmann::json::array();
    for (const auto& sp : r.suggested_parents) {
        suggestions.push_back({
            {"parent_key", sp.parent_key},
            {"parent_name", sp.parent_name},
            {"similarity_score", sp.similarity_score},
            {"improvement", sp.improvement},
            {"source_root_key", sp.source_root_key}
        });
    }
    j["suggested_parents"] = suggestions;

    j["validation"] = verdict_str(r.validation);
    j["validation_status"] = verdict_status_str(r.validation);
    return j;
}

nlohmann::json ReportArtifact::to_json() const {
    nlohmann::json j;
    j["data_path"] = data_path;
    j["cache_path"] = cache_path;

    j["config"] = {
        {"validity_threshold", cfg.validity_threshold},
        {"suggestion_threshold", cfg.suggestion_threshold},
        {"top_n", cfg.top_n}
    };

    j["filter"] = {
        {"status", status_filter_str(filter.status)},
        {"min_score", filter.min_score}
    };

    j["summary"] = {
        {"total_relationships", summary.total},
        {"valid", summary.valid},
        {"invalid", summary.invalid},
        {"pass_rate", summary.pass_rate},
        {"suggestions", summary.suggestion_count},
        {"mean_improvement", summary.mean_improvement},
        {"improvable", summary.improvable}
    };

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : results) arr.push_back(result_to_json(r));
    j["results"] = arr;

    nlohmann::json diags = nlohmann::json::array();
    for (const auto& d : diagnostics) {
        nlohmann::json dj;
        dj["code"] = d.code;
        dj["message"] = d.message;
        if (!d.root_key.empty()) dj["root_key"] = d.root_key;
        diags.push_back(dj);
    }
    j["diagnostics"] = diags;

    return j;
}

void ReportArtifact::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

}  // namespace hierarchy
