#include "hierarchy/MarkdownReport.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace hierarchy {

static std::string fmt2(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}

static std::string fmt_signed2(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%+.2f", v);
    return buf;
}

// table cells: escape pipes, flatten newlines
static std::string cell(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 4);
    for (char c : s) {
        if (c == '|') out += "\\|";
        else if (c == '\n' || c == '\r') out += ' ';
        else out += c;
    }
    return out;
}

static std::string summary_section(const ValidationSummary& s) {
    std::string out = "## Validation Summary\n\n";
    out += "- Total relationships: " + std::to_string(s.total) + "\n";
    out += "- Valid relationships: " + std::to_string(s.valid) +
           " (" + fmt2(s.pass_rate * 100.0) + "%)\n";
    out += "- Invalid relationships: " + std::to_string(s.invalid) + "\n";
    out += "- Suggestions: " + std::to_string(s.suggestion_count) + "\n";
    out += "- Avg. improvement possible: " + fmt2(s.mean_improvement) + "\n";
    out += "\n";
    return out;
}

static std::string current_section(const std::vector<ValidationResult>& results) {
    std::vector<const ValidationResult*> sorted;
    sorted.reserve(results.size());
    for (const auto& r : results) sorted.push_back(&r);
    std::stable_sort(sorted.begin(), sorted.end(), [](const ValidationResult* a, const ValidationResult* b) {
        return a->current_parent.similarity_score > b->current_parent.similarity_score;
    });

    std::string out = "## Current Relationships\n\n";
    if (sorted.empty()) return out + "_No relationships._\n\n";

    out += "| Root Key | Root Name | Current Parent | Score | Status |\n";
    out += "|---|---|---|---:|---|\n";
    for (const auto* r : sorted) {
        out += "| " + cell(r->root_key) + " | " + cell(r->root_name) + " | " +
               cell(r->current_parent.parent_name) + " | " +
               fmt2(r->current_parent.similarity_score) + " | " +
               verdict_str(r->validation) + " |\n";
    }
    out += "\n";
    return out;
}

static std::string suggestions_section(const std::vector<ValidationResult>& results) {
    std::string out = "## Suggested Parents\n\n";

    bool any = false;
    for (const auto& r : results) {
        if (r.suggested_parents.empty()) continue;
        any = true;

        out += "**" + r.root_name + "** (current: " + r.current_parent.parent_name +
               ", score " + fmt2(r.current_parent.similarity_score) + ")\n\n";
        out += "| Suggested Parent | Similarity | Improvement |\n";
        out += "|---|---:|---:|\n";

        // suggestions are already score-descending; improvement order is the same
        for (const auto& sp : r.suggested_parents) {
            out += "| " + cell(sp.parent_name) + " | " + fmt2(sp.similarity_score) + " | " +
                   fmt_signed2(sp.improvement) + " |\n";
        }
        out += "\n";
    }

    if (!any) out += "_No suggestions available._\n\n";
    return out;
}

std::string render_markdown_report(const ValidationSummary& summary,
                                   const std::vector<ValidationResult>& results) {
    std::string out = "# Hierarchy Relationship Validation\n\n";
    out += summary_section(summary);
    out += current_section(results);
    out += suggestions_section(results);
    return out;
}

void write_text(const std::filesystem::path& out_path, const std::string& text) {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << text;
    if (text.empty() || text.back() != '\n') out << "\n";
}

}  // namespace hierarchy
