#pragma once

#include <string>
#include <vector>

#include "hierarchy/Models.hpp"

namespace hierarchy {

// Root Key, Root Name, Current Parent Key, Current Parent, Score, Validation, Status
std::string render_current_csv(const std::vector<ValidationResult>& results);

// one row per suggestion, ordered by improvement descending
std::string render_suggestions_csv(const std::vector<ValidationResult>& results);

std::string csv_escape(const std::string& s);

}  // namespace hierarchy
