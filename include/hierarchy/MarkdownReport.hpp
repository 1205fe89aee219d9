#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "hierarchy/Models.hpp"
#include "hierarchy/Summary.hpp"

namespace hierarchy {

std::string render_markdown_report(const ValidationSummary& summary,
                                   const std::vector<ValidationResult>& results);

void write_text(const std::filesystem::path& out_path, const std::string& text);

}  // namespace hierarchy
