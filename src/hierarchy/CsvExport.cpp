#include "hierarchy/CsvExport.hpp"

#include "hierarchy/Summary.hpp"

#include <cstdio>

namespace hierarchy {

static std::string fmt4(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4f", v);
    return buf;
}

std::string csv_escape(const std::string& s) {
    if (s.find_first_of(",\"\r\n") == std::string::npos) return s;

    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += "\"\"";
        else out += c;
    }
    out += "\"";
    return out;
}

std::string render_current_csv(const std::vector<ValidationResult>& results) {
    std::string out = "Root Key,Root Name,Current Parent Key,Current Parent,Score,Validation,Status\r\n";
    for (const auto& r : results) {
        out += csv_escape(r.root_key) + "," + csv_escape(r.root_name) + "," +
               csv_escape(r.current_parent.parent_key) + "," +
               csv_escape(r.current_parent.parent_name) + "," +
               fmt4(r.current_parent.similarity_score) + "," +
               verdict_str(r.validation) + "," + verdict_status_str(r.validation) + "\r\n";
    }
    return out;
}

std::string render_suggestions_csv(const std::vector<ValidationResult>& results) {
    std::string out =
        "Root Key,Root Name,Current Parent,Suggested Parent Key,Suggested Parent,Similarity Score,Improvement\r\n";
    for (const auto& row : improvement_rows(results)) {
        out += csv_escape(row.root_key) + "," + csv_escape(row.root_name) + "," +
               csv_escape(row.current_parent) + "," + csv_escape(row.suggested_parent_key) + "," +
               csv_escape(row.suggested_parent) + "," + fmt4(row.similarity_score) + "," +
               fmt4(row.improvement) + "\r\n";
    }
    return out;
}

}  // namespace hierarchy
